#include "drop_zone_layout.hpp"

#include <algorithm>
#include <cmath>

namespace kestrel
{

void DropZoneLayouts::set_layout(const Container& zone, const DropZoneLayout& layout)
{
    DropZoneLayout copy = layout;
    if (copy.cell_size <= 0.0f)
        copy.cell_size = default_cell_size_;
    if (copy.cell_spacing < 0.0f)
        copy.cell_spacing = default_cell_spacing_;
    copy.item_count = std::max(0, copy.item_count);
    layouts_[zone]  = copy;
}

void DropZoneLayouts::remove_layout(const Container& zone)
{
    layouts_.erase(zone);
}

const DropZoneLayout* DropZoneLayouts::layout(const Container& zone) const
{
    auto it = layouts_.find(zone);
    return (it != layouts_.end()) ? &it->second : nullptr;
}

// Float to int, limited to [0, hi] first so far-off pointers (or NaN) never
// overflow the conversion.
static int to_index(float v, int hi)
{
    if (!(v > 0.0f))
        return 0;
    return static_cast<int>(std::min(v, static_cast<float>(hi)));
}

int DropZoneLayouts::insertion_index(const Container& zone, Point local, bool same_container) const
{
    const DropZoneLayout* l = layout(zone);
    if (!l)
        return 0;

    const float step = l->cell_size + l->cell_spacing;
    int         idx  = 0;

    if (l->grid_columns > 0)
    {
        const int   cols       = l->grid_columns;
        const float zone_width = l->frame.w > 0.0f ? l->frame.w : static_cast<float>(cols) * step;
        const float col_width  = zone_width / static_cast<float>(cols);
        const int   col = to_index(local.x / col_width, cols - 1);
        const int   row = step > 0.0f ? to_index(local.y / step, l->item_count) : 0;
        idx             = row * cols + col;
    }
    else
    {
        const float offset = l->vertical ? local.y : local.x;
        idx                = step > 0.0f ? to_index(std::round(offset / step), l->item_count) : 0;
    }

    // Upper bound first so an empty zone still lands on 0.
    const int upper = same_container ? l->item_count - 1 : l->item_count;
    return std::max(0, std::min(idx, upper));
}

std::optional<Rect> DropZoneLayouts::indicator_rect(const Container& zone, int index) const
{
    const DropZoneLayout* l = layout(zone);
    if (!l)
        return std::nullopt;

    index              = std::max(0, index);
    const float step   = l->cell_size + l->cell_spacing;
    const float thick  = l->line_thickness;
    const float half_s = l->cell_spacing * 0.5f;

    if (l->grid_columns > 0)
    {
        const int   cols      = l->grid_columns;
        const float col_width = (l->frame.w > 0.0f ? l->frame.w : cols * step) / cols;
        const int   row       = index / cols;
        const int   col       = index % cols;
        return Rect{l->frame.x + col * col_width - thick * 0.5f,
                    l->frame.y + row * step,
                    thick,
                    l->cell_size};
    }

    if (l->vertical)
    {
        return Rect{l->frame.x,
                    l->frame.y + index * step - half_s - thick * 0.5f,
                    l->frame.w,
                    thick};
    }
    return Rect{l->frame.x + index * step - half_s - thick * 0.5f,
                l->frame.y,
                thick,
                l->frame.h};
}

}  // namespace kestrel
