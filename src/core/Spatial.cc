#include "oddity/core/Spatial.hh"

namespace oddity {

Rect::Rect() : min(Vec2f(0.0f, 0.0f)), max(Vec2f(0.0f, 0.0f)) {}

Rect::Rect(const Vec2f& min, const Vec2f& max) : min(min), max(max) {}

Rect Rect::fromCenter(const Vec2f& center, float width, float height) {
    Vec2f half(width * 0.5f, height * 0.5f);
    return Rect(center - half, center + half);
}

float Rect::width() const {
    return max.x - min.x;
}

float Rect::height() const {
    return max.y - min.y;
}

float Rect::top() const {
    return min.y;
}

float Rect::bottom() const {
    return max.y;
}

Vec2f Rect::center() const {
    return (min + max) * 0.5f;
}

bool Rect::contains(const Vec2f& point) const {
    return point.x >= min.x && point.x <= max.x && point.y >= min.y && point.y <= max.y;
}

bool Rect::intersects(const Rect& other) const {
    return min.x <= other.max.x && max.x >= other.min.x && min.y <= other.max.y && max.y >= other.min.y;
}

bool Rect::overlapsHorizontally(const Rect& other) const {
    return min.x < other.max.x && max.x > other.min.x;
}

} // namespace oddity
