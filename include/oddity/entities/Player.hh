#pragma once

#include "oddity/core/Entity.hh"

#include <cstdint>

namespace oddity {

struct PlayerConfig {
    float speed = 300.0f;      // px/s
    float jumpPower = 800.0f;  // initial upward velocity, px/s
    float gravity = 980.0f;    // px/s^2
    int32_t maxHealth = 100;
    float invulnerabilityMs = 1000.0f;
    float dashCooldownMs = 1000.0f;  // counted from the start of a dash
    float dashDurationMs = 240.0f;
    float dashSpeed = 1000.0f;       // peak horizontal speed, px/s
    // Also rewind health and the invulnerability window. Off by default:
    // rewinding restores where the player was, not the damage taken.
    bool rewindVitals = false;
};

// Input for one frame, already debounced by the input layer.
struct PlayerInput {
    bool left = false;
    bool right = false;
    bool jump = false;
    bool dash = false;
};

class Player : public Entity {
  public:
    static constexpr float kWidth = 32.0f;
    static constexpr float kHeight = 48.0f;

    Player(float x, float y, PlayerConfig config = {});

    void setInput(const PlayerInput& input);
    const PlayerInput& input() const;

    void update(double time, float deltaMs) override;

    bool isOnGround() const;
    // Called by the scene after resolving a landing on a floor or platform.
    void land(float surfaceY);
    // Pick dash/idle/run/jump/fall from the resolved ground contact and velocity.
    void refreshAnimation();

    bool isDashing() const;
    bool canDash() const;
    float dashCooldownRemaining() const;
    // +1 facing right, -1 facing left. Dashes go this way.
    int32_t facing() const;

    int32_t health() const;
    bool isInvulnerable() const;
    double invulnerableUntil() const;

    /// Returns true when the hit was lethal. Hits during the invulnerability
    /// window are ignored.
    bool takeDamage(int32_t amount, double now);
    void heal(int32_t amount);
    bool isDead() const;

    const PlayerConfig& config() const;

    void onRewindToggled(bool rewinding) override;

  protected:
    void captureFields(EntityState& state) const override;
    void applyFields(const EntityState& state) override;

  private:
    void startDash();
    void stepDash(float deltaMs);
    void endDash();

    PlayerConfig config_;
    PlayerInput input_;
    int32_t health_;
    bool invulnerable_ = false;
    double invulnerableUntil_ = 0.0;

    // Dash timers are countdowns so a restored state resumes where it was.
    bool canDash_ = true;
    bool dashing_ = false;
    float dashCooldownRemaining_ = 0.0f;
    float dashElapsed_ = 0.0f;
    int32_t facing_ = 1;
};

} // namespace oddity
