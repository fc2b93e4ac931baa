#pragma once

#include "oddity/core/Entity.hh"

#include <cstdint>

namespace oddity {

struct PatrolEnemyConfig {
    float speed = 80.0f;            // px/s
    float patrolDistance = 200.0f;  // px to the right of the spawn point
    int32_t maxHealth = 100;
    int32_t contactDamage = 20;
};

/**
 * @brief Ground enemy walking back and forth between two x bounds
 *
 * Can be frozen for a duration (ChronoPulse). The freeze countdown is part of
 * the recorded state, so after a rewind it resumes from the restored value.
 */
class PatrolEnemy : public Entity {
  public:
    static constexpr float kWidth = 32.0f;
    static constexpr float kHeight = 32.0f;

    PatrolEnemy(float x, float y, PatrolEnemyConfig config = {});

    void update(double time, float deltaMs) override;

    void freeze(float durationMs);
    void unfreeze();
    bool isFrozen() const;
    float freezeRemaining() const;

    int32_t direction() const;
    float patrolStartX() const;
    float patrolEndX() const;

    int32_t health() const;
    void takeDamage(int32_t amount);
    void die();
    bool isDead() const;

    int32_t contactDamage() const;

  protected:
    void captureFields(EntityState& state) const override;
    void applyFields(const EntityState& state) override;

  private:
    PatrolEnemyConfig config_;
    int32_t direction_ = 1;
    bool frozen_ = false;
    float freezeRemaining_ = 0.0f;
    float patrolStartX_;
    float patrolEndX_;
    int32_t health_;
};

} // namespace oddity
