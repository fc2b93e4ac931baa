#pragma once

#include "oddity/core/Spatial.hh"

namespace oddity {

struct TouchingFlags {
    bool up = false;
    bool down = false;
    bool left = false;
    bool right = false;

    void reset() { up = down = left = right = false; }
};

// Arcade-style kinematic body. Integrates velocity and gravity; collision
// resolution belongs to the scene.
class PhysicsBody {
  public:
    PhysicsBody(float width, float height);

    const Vec2f& velocity() const;
    void setVelocity(float vx, float vy);
    void setVelocityX(float vx);
    void setVelocityY(float vy);

    float gravity() const;
    void setGravity(float pixelsPerSecondSq);
    bool allowGravity() const;
    void setAllowGravity(bool allow);

    bool immovable() const;
    void setImmovable(bool immovable);

    TouchingFlags& touching();
    const TouchingFlags& touching() const;

    float width() const;
    float height() const;
    void setSize(float width, float height);

    // Apply gravity for `deltaMs` and return the displacement for the frame.
    Vec2f step(float deltaMs);

  private:
    Vec2f velocity_;
    float gravity_ = 0.0f;
    bool allowGravity_ = true;
    bool immovable_ = false;
    TouchingFlags touching_;
    float width_;
    float height_;
};

} // namespace oddity
