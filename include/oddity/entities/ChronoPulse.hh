#pragma once

#include "oddity/core/Spatial.hh"

#include <cstdint>
#include <optional>
#include <vector>

namespace oddity {

class PatrolEnemy;

struct ChronoPulseConfig {
    float cooldownMs = 3000.0f;
    float range = 300.0f;       // px, measured between positions
    float durationMs = 2000.0f; // freeze applied to each enemy hit
};

/**
 * @brief Player ability that freezes nearby enemies
 *
 * Not a rewindable object itself: the freeze it applies lives in each
 * enemy's recorded state.
 */
class ChronoPulse {
  public:
    explicit ChronoPulse(ChronoPulseConfig config = {});

    void setPosition(const Vec2f& position);
    const Vec2f& position() const;

    bool canActivate(double now) const;
    double cooldownRemaining(double now) const;

    /// Freeze every active enemy in range. Returns the number frozen, or
    /// std::nullopt while the ability is cooling down.
    std::optional<uint32_t> activate(double now, const std::vector<PatrolEnemy*>& enemies);

    const ChronoPulseConfig& config() const;

  private:
    ChronoPulseConfig config_;
    Vec2f position_;
    std::optional<double> lastActivation_;
};

} // namespace oddity
