#pragma once

#include <kestrel/container.hpp>
#include <kestrel/geometry.hpp>
#include <optional>
#include <unordered_map>

namespace kestrel
{

// Geometry of one drop zone as last reported by the sidebar view.
struct DropZoneLayout
{
    Rect  frame;                 // zone rectangle, window coordinates
    float cell_size    = 36.0f;  // row height (or column width when horizontal)
    float cell_spacing = 2.0f;
    int   item_count   = 0;
    bool  vertical     = true;
    int   grid_columns = 0;      // > 0 for grid zones (essentials)
    float line_thickness = 2.0f;
};

// Per-container geometry cache used to turn a pointer position into an
// insertion index and an insertion-line rectangle.
class DropZoneLayouts
{
   public:
    DropZoneLayouts() = default;

    void set_layout(const Container& zone, const DropZoneLayout& layout);
    void remove_layout(const Container& zone);
    void clear() { layouts_.clear(); }

    const DropZoneLayout* layout(const Container& zone) const;

    // Insertion index for a pointer at `local` (relative to the zone frame).
    // Same-container drags clamp to [0, count-1], cross-container drops to
    // [0, count].  Zones without a layout yield 0.
    int insertion_index(const Container& zone, Point local, bool same_container) const;

    // Insertion indicator for `index`, in window coordinates.
    std::optional<Rect> indicator_rect(const Container& zone, int index) const;

    // Defaults used for zones registered without explicit cell metrics.
    void set_default_metrics(float cell_size, float cell_spacing)
    {
        default_cell_size_    = cell_size;
        default_cell_spacing_ = cell_spacing;
    }
    float default_cell_size() const { return default_cell_size_; }
    float default_cell_spacing() const { return default_cell_spacing_; }

   private:
    std::unordered_map<Container, DropZoneLayout, ContainerHash> layouts_;
    float default_cell_size_    = 36.0f;
    float default_cell_spacing_ = 2.0f;
};

}  // namespace kestrel
