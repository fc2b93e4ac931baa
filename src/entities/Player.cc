#include "oddity/entities/Player.hh"

#include "oddity/core/Log.hh"

#include <algorithm>
#include <cmath>

namespace oddity {

Player::Player(float x, float y, PlayerConfig config)
    : Entity("player", x, y), config_(config), health_(config.maxHealth) {
    setOrigin(0.5f, 1.0f);

    auto& body = enableBody(kWidth, kHeight);
    body.setGravity(config_.gravity);

    auto& anims = enableAnimations();
    anims.addClip("player_idle", {6.0f, 4, true});
    anims.addClip("player_run", {12.0f, 8, true});
    anims.addClip("player_jump", {10.0f, 2, false});
    anims.addClip("player_fall", {10.0f, 2, false});
    anims.addClip("player_dash", {20.0f, 4, false});
    anims.play("player_idle");
}

void Player::setInput(const PlayerInput& input) {
    input_ = input;
}

const PlayerInput& Player::input() const {
    return input_;
}

void Player::update(double time, float deltaMs) {
    if (invulnerable_ && time >= invulnerableUntil_) {
        invulnerable_ = false;
    }

    auto* physics = body();
    if (!dashing_ && input_.left != input_.right) {
        facing_ = input_.left ? -1 : 1;
    }

    if (!dashing_ && input_.dash && canDash_) {
        startDash();
    }

    if (dashing_) {
        stepDash(deltaMs);
    } else {
        if (input_.left == input_.right) {
            physics->setVelocityX(0.0f);
        } else {
            physics->setVelocityX(input_.left ? -config_.speed : config_.speed);
        }

        if (input_.jump && isOnGround()) {
            physics->setVelocityY(-config_.jumpPower);
        }
    }

    if (dashCooldownRemaining_ > 0.0f) {
        dashCooldownRemaining_ -= deltaMs;
        if (dashCooldownRemaining_ <= 0.0f) {
            dashCooldownRemaining_ = 0.0f;
            canDash_ = true;
        }
    }

    // Support is re-established by the scene every frame
    physics->touching().reset();
    Entity::update(time, deltaMs);
}

void Player::startDash() {
    dashing_ = true;
    canDash_ = false;
    dashCooldownRemaining_ = config_.dashCooldownMs;
    dashElapsed_ = 0.0f;
    body()->setAllowGravity(false);
    body()->setVelocityY(0.0f);
    ODDITY_LOG_DEBUG("Player dash {} from ({}, {})", facing_ > 0 ? "right" : "left", x(), y());
}

// Speed follows 1 - (2t/T - 1)^2: zero at both ends, peak halfway through.
void Player::stepDash(float deltaMs) {
    dashElapsed_ += deltaMs;
    if (dashElapsed_ >= config_.dashDurationMs) {
        endDash();
        return;
    }
    float norm = 2.0f * dashElapsed_ / config_.dashDurationMs - 1.0f;
    body()->setVelocity(static_cast<float>(facing_) * config_.dashSpeed * (1.0f - norm * norm), 0.0f);
}

void Player::endDash() {
    dashing_ = false;
    dashElapsed_ = 0.0f;
    body()->setVelocityX(0.0f);
    if (!gravitySuspended()) {
        body()->setAllowGravity(true);
    }
}

bool Player::isOnGround() const {
    return body()->touching().down;
}

void Player::land(float surfaceY) {
    auto* physics = body();
    setPosition(x(), surfaceY);
    if (physics->velocity().y > 0.0f) {
        physics->setVelocityY(0.0f);
    }
    physics->touching().down = true;
}

int32_t Player::health() const {
    return health_;
}

bool Player::isInvulnerable() const {
    return invulnerable_;
}

double Player::invulnerableUntil() const {
    return invulnerableUntil_;
}

bool Player::takeDamage(int32_t amount, double now) {
    if (invulnerable_) {
        return false;
    }
    if (amount < 0) {
        heal(-amount);
        return false;
    }

    int32_t previous = health_;
    health_ = std::max(0, health_ - amount);
    invulnerable_ = true;
    invulnerableUntil_ = now + config_.invulnerabilityMs;
    ODDITY_LOG_INFO("Player hit for {} ({} -> {})", amount, previous, health_);

    if (isDead()) {
        ODDITY_LOG_INFO("Player died at ({}, {})", x(), y());
        return true;
    }
    return false;
}

void Player::heal(int32_t amount) {
    health_ = std::min(config_.maxHealth, health_ + amount);
}

bool Player::isDead() const {
    return health_ <= 0;
}

bool Player::isDashing() const {
    return dashing_;
}

bool Player::canDash() const {
    return canDash_;
}

float Player::dashCooldownRemaining() const {
    return dashCooldownRemaining_;
}

int32_t Player::facing() const {
    return facing_;
}

const PlayerConfig& Player::config() const {
    return config_;
}

void Player::onRewindToggled(bool rewinding) {
    Entity::onRewindToggled(rewinding);
    if (!rewinding) {
        // A restored dash keeps flying level
        body()->setAllowGravity(!dashing_);
    }
}

void Player::captureFields(EntityState& state) const {
    state.set("canDash", canDash_);
    state.set("isDashing", dashing_);
    state.set("dashCooldownRemaining", static_cast<double>(dashCooldownRemaining_));
    state.set("dashElapsed", static_cast<double>(dashElapsed_));
    state.set("facing", static_cast<int64_t>(facing_));

    if (!config_.rewindVitals) {
        return;
    }
    state.set("health", static_cast<int64_t>(health_));
    state.set("isInvulnerable", invulnerable_);
    state.set("invulnerableUntil", invulnerableUntil_);
}

void Player::applyFields(const EntityState& state) {
    if (auto can = state.get<bool>("canDash")) {
        canDash_ = *can;
    }
    if (auto dashing = state.get<bool>("isDashing")) {
        dashing_ = *dashing;
    }
    if (auto cooldown = state.getNumber("dashCooldownRemaining")) {
        dashCooldownRemaining_ = std::max(0.0f, static_cast<float>(*cooldown));
    }
    if (auto elapsed = state.getNumber("dashElapsed")) {
        dashElapsed_ = std::max(0.0f, static_cast<float>(*elapsed));
    }
    if (auto dir = state.get<int64_t>("facing")) {
        facing_ = *dir < 0 ? -1 : 1;
    }
    if (!gravitySuspended()) {
        body()->setAllowGravity(!dashing_);
    }

    if (!config_.rewindVitals) {
        return;
    }
    if (auto h = state.get<int64_t>("health")) {
        health_ = static_cast<int32_t>(*h);
    }
    if (auto inv = state.get<bool>("isInvulnerable")) {
        invulnerable_ = *inv;
    }
    if (auto until = state.getNumber("invulnerableUntil")) {
        invulnerableUntil_ = *until;
    }
}

void Player::refreshAnimation() {
    const auto& velocity = body()->velocity();
    if (dashing_) {
        playAnimation("player_dash");
    } else if (!isOnGround()) {
        playAnimation(velocity.y < 0.0f ? "player_jump" : "player_fall");
    } else if (std::abs(velocity.x) > 0.0f) {
        playAnimation("player_run");
    } else {
        playAnimation("player_idle");
    }
}

} // namespace oddity
