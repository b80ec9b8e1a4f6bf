#pragma once

namespace kestrel
{

struct Point
{
    float x = 0.0f;
    float y = 0.0f;
};

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    bool contains(const Point& p) const { return p.x >= x && p.x < x + w && p.y >= y && p.y < y + h; }
    bool empty() const { return w <= 0.0f || h <= 0.0f; }
};

inline bool operator==(const Rect& a, const Rect& b)
{
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}

}  // namespace kestrel
