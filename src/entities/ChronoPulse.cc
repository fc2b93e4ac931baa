#include "oddity/entities/ChronoPulse.hh"

#include "oddity/core/Log.hh"
#include "oddity/entities/PatrolEnemy.hh"

#include <algorithm>

namespace oddity {

ChronoPulse::ChronoPulse(ChronoPulseConfig config) : config_(config) {}

void ChronoPulse::setPosition(const Vec2f& position) {
    position_ = position;
}

const Vec2f& ChronoPulse::position() const {
    return position_;
}

bool ChronoPulse::canActivate(double now) const {
    return cooldownRemaining(now) <= 0.0;
}

double ChronoPulse::cooldownRemaining(double now) const {
    if (!lastActivation_) {
        return 0.0;
    }
    return std::max(0.0, *lastActivation_ + config_.cooldownMs - now);
}

std::optional<uint32_t> ChronoPulse::activate(double now, const std::vector<PatrolEnemy*>& enemies) {
    if (!canActivate(now)) {
        ODDITY_LOG_DEBUG("Chrono pulse on cooldown ({} ms left)", cooldownRemaining(now));
        return std::nullopt;
    }
    lastActivation_ = now;

    uint32_t frozen = 0;
    for (auto* enemy : enemies) {
        if (!enemy || !enemy->isActive()) {
            continue;
        }
        if ((enemy->position() - position_).length() <= config_.range) {
            enemy->freeze(config_.durationMs);
            ++frozen;
        }
    }
    ODDITY_LOG_INFO("Chrono pulse at ({}, {}) froze {} enemies", position_.x, position_.y, frozen);
    return frozen;
}

const ChronoPulseConfig& ChronoPulse::config() const {
    return config_;
}

} // namespace oddity
