#pragma once

#include "oddity/core/Entity.hh"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oddity {

enum class MovementType : uint8_t {
    Linear,
    Circular,
    Path
};

enum class LinearMode : uint8_t {
    Bounce, // reverse at either end
    Loop    // jump back to the start at the end
};

std::string_view movementTypeToString(MovementType type);
std::optional<MovementType> movementTypeFromString(std::string_view name);

struct PlatformMovement {
    MovementType type = MovementType::Linear;
    float speed = 60.0f; // px/s, clamped to [kMinSpeed, kMaxSpeed]
    bool autoStart = false;

    // Linear. Unset points default to the spawn point and spawn + (200, 0).
    std::optional<Vec2f> start;
    std::optional<Vec2f> end;
    LinearMode mode = LinearMode::Bounce;

    // Circular. Unset centre defaults to the spawn point.
    std::optional<Vec2f> center;
    float radius = 50.0f;
    float startAngle = 0.0f; // radians

    // Path
    std::vector<Vec2f> path;
    bool loop = true;
};

/**
 * @brief Kinematic platform made of one master tile and dependent tiles
 *
 * Only the master is registered with the TimeManager. Dependent segment
 * positions are never stored: segment i always sits at
 * master + (i * kTileWidth, 0) and is re-derived after every move and every
 * applyState().
 */
class MovingPlatform : public Entity {
  public:
    static constexpr float kTileWidth = 64.0f;
    static constexpr float kTileHeight = 64.0f;
    static constexpr float kMinSpeed = 10.0f;
    static constexpr float kMaxSpeed = 200.0f;
    static constexpr float kTargetTolerance = 5.0f;

    MovingPlatform(float x, float y, float width = kTileWidth, PlatformMovement movement = {});

    void start();
    void stop();
    bool isMoving() const;
    bool isMovingToTarget() const;

    void update(double time, float deltaMs) override;

    MovementType movementType() const;
    float speed() const;
    int32_t direction() const;
    float angle() const;
    int32_t currentPathIndex() const;
    Vec2f target() const;

    // --- Composite structure ---

    float width() const;
    void setWidth(float width);
    int32_t segmentCount() const;
    Vec2f segmentPosition(int32_t index) const;
    const std::vector<Vec2f>& segmentPositions() const;
    Rect segmentBounds(int32_t index) const;
    Rect bounds() const override;

    // --- Carrying ---

    /// Master displacement produced by the last update(). Zero on the first
    /// forward frame after applyState() or after a rewind ends.
    Vec2f frameDelta() const;

    /// True when the rider's feet rest on the top of any segment.
    bool isStandingOn(const Entity& rider) const;

    /// Move a rider that stood on the platform at the start of this frame by
    /// frameDelta(). Returns true when the rider was carried.
    bool carryIfStanding(Entity& rider) const;

    void onRewindToggled(bool rewinding) override;

  protected:
    void captureFields(EntityState& state) const override;
    void applyFields(const EntityState& state) override;

  private:
    void advance(float deltaMs);
    void stepTowardTarget(float deltaMs);
    void stepCircular(float deltaMs);
    void moveToTarget(const Vec2f& target);
    void onTargetReached();
    void handleLinearTargetReached();
    void advancePath();
    bool isNear(const Vec2f& point) const;

    void rebuildSegments();
    void syncSegments();
    void resync();

    MovementType type_;
    LinearMode mode_;
    float speed_;
    bool moving_ = false;
    bool movingToTarget_ = false;
    int32_t direction_ = 1;

    Vec2f start_;
    Vec2f end_;

    Vec2f center_;
    float radius_;
    float angle_;

    std::vector<Vec2f> path_;
    bool loop_;
    int32_t pathIndex_ = 0;

    Vec2f target_;

    float width_ = kTileWidth;
    int32_t segmentCount_ = 1;
    std::vector<Vec2f> segments_;

    Vec2f previous_;
    Vec2f frameDelta_;
    bool resyncPending_ = false;
};

} // namespace oddity
