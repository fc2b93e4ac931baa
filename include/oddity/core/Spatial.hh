#pragma once

#include <cmath>

namespace oddity {

/**
 * @brief Type tags for different coordinate spaces
 *
 * World positions and offsets relative to a master sprite use different tags
 * so the compiler rejects adding a local offset to a world vector by accident.
 */
namespace Space {
struct Local {}; // Relative to a parent sprite
struct World {}; // Level coordinates in pixels, y grows downwards
} // namespace Space

/**
 * @brief 2D vector class with coordinate space type safety
 *
 * @tparam T Numeric type (float, double, etc.)
 * @tparam SpaceTag Coordinate space tag
 */
template <typename T, typename SpaceTag = Space::World> class Vector2 {
  public:
    T x, y;

    Vector2() : x(0), y(0) {}
    Vector2(T x, T y) : x(x), y(y) {}

    Vector2<T, SpaceTag> operator+(const Vector2<T, SpaceTag>& other) const {
        return Vector2<T, SpaceTag>(x + other.x, y + other.y);
    }

    Vector2<T, SpaceTag> operator-(const Vector2<T, SpaceTag>& other) const {
        return Vector2<T, SpaceTag>(x - other.x, y - other.y);
    }

    Vector2<T, SpaceTag> operator*(T scalar) const { return Vector2<T, SpaceTag>(x * scalar, y * scalar); }

    Vector2<T, SpaceTag> operator/(T scalar) const { return Vector2<T, SpaceTag>(x / scalar, y / scalar); }

    Vector2<T, SpaceTag>& operator+=(const Vector2<T, SpaceTag>& other) {
        x += other.x;
        y += other.y;
        return *this;
    }

    bool operator==(const Vector2<T, SpaceTag>& other) const = default;

    // Cannot mix different spaces - these operations are deleted
    template <typename OtherSpace> Vector2<T, SpaceTag> operator+(const Vector2<T, OtherSpace>&) const = delete;

    template <typename OtherSpace> Vector2<T, SpaceTag> operator-(const Vector2<T, OtherSpace>&) const = delete;

    T dot(const Vector2<T, SpaceTag>& other) const { return x * other.x + y * other.y; }

    T lengthSquared() const { return x * x + y * y; }

    T length() const { return std::sqrt(lengthSquared()); }

    Vector2<T, SpaceTag> normalized() const {
        T len = length();
        if (len == 0)
            return *this;
        return *this / len;
    }

    // Reinterpret in another space. Use only where the conversion is explicit,
    // e.g. master position + local segment offset.
    template <typename TargetSpace> Vector2<T, TargetSpace> as() const { return Vector2<T, TargetSpace>(x, y); }
};

using Vec2f = Vector2<float, Space::World>;
using LocalVec2f = Vector2<float, Space::Local>;

// Axis-aligned rectangle in world space. min is the top-left corner.
class Rect {
  public:
    Vec2f min;
    Vec2f max;

    Rect();
    Rect(const Vec2f& min, const Vec2f& max);

    static Rect fromCenter(const Vec2f& center, float width, float height);

    float width() const;
    float height() const;
    float top() const;
    float bottom() const;
    Vec2f center() const;

    bool contains(const Vec2f& point) const;
    bool intersects(const Rect& other) const;
    bool overlapsHorizontally(const Rect& other) const;
};

} // namespace oddity
