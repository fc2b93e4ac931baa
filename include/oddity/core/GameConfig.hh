#pragma once

#include "oddity/core/TimeManager.hh"
#include "oddity/entities/ChronoPulse.hh"
#include "oddity/entities/PatrolEnemy.hh"
#include "oddity/entities/Player.hh"
#include "oddity/utils/ErrorHandling.hh"

#include <filesystem>
#include <string_view>

namespace oddity {

struct WorldConfig {
    float floorY = 600.0f; // top of the world floor, px
};

// Tunables for one play session. Every field has a default, so an empty
// document is a valid configuration.
struct GameConfig {
    TimeManagerConfig time;
    PlayerConfig player;
    PatrolEnemyConfig enemy;
    ChronoPulseConfig pulse;
    WorldConfig world;
};

class DataLoader;

/// Fill a GameConfig from a parsed document. Present keys override the
/// defaults; a key with the wrong type or an out-of-range value fails.
Result<GameConfig> readGameConfig(const DataLoader& loader);

Result<GameConfig> parseGameConfig(std::string_view tomlContent);
Result<GameConfig> loadGameConfig(const std::filesystem::path& path);

} // namespace oddity
