#include "oddity/entities/PatrolEnemy.hh"

#include "oddity/core/Log.hh"

#include <algorithm>

namespace oddity {

PatrolEnemy::PatrolEnemy(float x, float y, PatrolEnemyConfig config)
    : Entity("enemy", x, y),
      config_(config),
      patrolStartX_(x),
      patrolEndX_(x + config.patrolDistance),
      health_(config.maxHealth) {
    setOrigin(0.5f, 1.0f);

    auto& body = enableBody(kWidth, kHeight);
    body.setAllowGravity(false);

    enableAnimations().addClip("enemy_patrol", {4.0f, 2, true});
}

void PatrolEnemy::update(double time, float deltaMs) {
    if (!isActive()) {
        return;
    }

    if (frozen_) {
        freezeRemaining_ -= deltaMs;
        if (freezeRemaining_ <= 0.0f) {
            unfreeze();
        }
        // No movement on the frame the freeze runs out
        return;
    }

    body()->setVelocityX(config_.speed * static_cast<float>(direction_));
    Entity::update(time, deltaMs);
    playAnimation("enemy_patrol");

    if (x() >= patrolEndX_) {
        direction_ = -1;
    } else if (x() <= patrolStartX_) {
        direction_ = 1;
    }
}

void PatrolEnemy::freeze(float durationMs) {
    frozen_ = true;
    freezeRemaining_ = durationMs;
    body()->setVelocity(0.0f, 0.0f);
    animations()->stop();
}

void PatrolEnemy::unfreeze() {
    frozen_ = false;
    freezeRemaining_ = 0.0f;
}

bool PatrolEnemy::isFrozen() const {
    return frozen_;
}

float PatrolEnemy::freezeRemaining() const {
    return freezeRemaining_;
}

int32_t PatrolEnemy::direction() const {
    return direction_;
}

float PatrolEnemy::patrolStartX() const {
    return patrolStartX_;
}

float PatrolEnemy::patrolEndX() const {
    return patrolEndX_;
}

int32_t PatrolEnemy::health() const {
    return health_;
}

void PatrolEnemy::takeDamage(int32_t amount) {
    if (isDead()) {
        return;
    }
    health_ = std::max(0, health_ - amount);
    if (health_ == 0) {
        die();
    }
}

void PatrolEnemy::die() {
    health_ = 0;
    setActive(false);
    setVisible(false);
    body()->setVelocity(0.0f, 0.0f);
    ODDITY_LOG_INFO("Enemy defeated at ({}, {})", x(), y());
}

bool PatrolEnemy::isDead() const {
    return health_ <= 0;
}

int32_t PatrolEnemy::contactDamage() const {
    return config_.contactDamage;
}

void PatrolEnemy::captureFields(EntityState& state) const {
    state.set("direction", static_cast<int64_t>(direction_));
    state.set("isFrozen", frozen_);
    state.set("freezeRemaining", static_cast<double>(freezeRemaining_));
    state.set("patrolStartX", static_cast<double>(patrolStartX_));
    state.set("patrolEndX", static_cast<double>(patrolEndX_));
    state.set("health", static_cast<int64_t>(health_));
}

void PatrolEnemy::applyFields(const EntityState& state) {
    if (auto dir = state.get<int64_t>("direction")) {
        direction_ = *dir < 0 ? -1 : 1;
    }
    if (auto start = state.getNumber("patrolStartX")) {
        patrolStartX_ = static_cast<float>(*start);
    }
    if (auto end = state.getNumber("patrolEndX")) {
        patrolEndX_ = static_cast<float>(*end);
    }
    if (auto h = state.get<int64_t>("health")) {
        health_ = static_cast<int32_t>(*h);
    }

    // The countdown is the recorded value, never a stale live timer
    if (auto frozen = state.get<bool>("isFrozen")) {
        frozen_ = *frozen;
        if (!frozen_) {
            freezeRemaining_ = 0.0f;
        } else if (auto remaining = state.getNumber("freezeRemaining")) {
            freezeRemaining_ = std::max(0.0f, static_cast<float>(*remaining));
        }
    }
    if (frozen_) {
        animations()->stop();
    }
}

} // namespace oddity
