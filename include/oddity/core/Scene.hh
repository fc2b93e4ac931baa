#pragma once

#include "oddity/core/GameConfig.hh"
#include "oddity/core/TimeManager.hh"
#include "oddity/entities/ChronoPulse.hh"
#include "oddity/entities/Coin.hh"
#include "oddity/entities/MovingPlatform.hh"
#include "oddity/entities/PatrolEnemy.hh"
#include "oddity/entities/Player.hh"

#include <cstdint>
#include <memory>
#include <vector>

namespace oddity {

/**
 * @brief Headless level: owns the time manager and every entity in it
 *
 * Drives one frame at a time through update(). Spawned entities are
 * registered with the time manager as soon as their body exists.
 */
class Scene {
  public:
    explicit Scene(GameConfig config = {});
    ~Scene();

    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    Player& spawnPlayer(float x, float y);
    PatrolEnemy& spawnEnemy(float x, float y);
    MovingPlatform& spawnPlatform(float x, float y, float width = MovingPlatform::kTileWidth,
                                  PlatformMovement movement = {});
    Coin& spawnCoin(float x, float y);

    /// Unregister and delete an entity owned by this scene. Returns false
    /// for an entity the scene does not own.
    bool destroyEntity(const Entity& entity);

    // --- Input boundary ---

    void setPlayerInput(const PlayerInput& input);
    /// Level signal from the input layer; only edges toggle rewind.
    void setRewindHeld(bool held);
    /// Fire the chrono pulse on the next forward frame.
    void requestPulse();

    void update(double now, float deltaMs);

    TimeManager& timeManager();
    const TimeManager& timeManager() const;

    Player* player();
    const std::vector<std::unique_ptr<PatrolEnemy>>& enemies() const;
    const std::vector<std::unique_ptr<MovingPlatform>>& platforms() const;
    const std::vector<std::unique_ptr<Coin>>& coins() const;
    ChronoPulse& chronoPulse();

    uint32_t coinsCollected() const;
    const GameConfig& config() const;

  private:
    void stepForward(double now, float deltaMs);
    void resolvePlayerSupport(float previousBottom);
    void resolveContacts(double now);
    void firePulse(double now);

    GameConfig config_;
    // Declared before the entities: they unregister from it on destruction
    TimeManager timeManager_;

    std::unique_ptr<Player> player_;
    std::vector<std::unique_ptr<PatrolEnemy>> enemies_;
    std::vector<std::unique_ptr<MovingPlatform>> platforms_;
    std::vector<std::unique_ptr<Coin>> coins_;
    ChronoPulse pulse_;

    bool rewindHeld_ = false;
    bool pulseRequested_ = false;
    uint32_t coinsCollected_ = 0;
};

} // namespace oddity
