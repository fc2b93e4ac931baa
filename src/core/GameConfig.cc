#include "oddity/core/GameConfig.hh"

#include "oddity/core/DataLoader.hh"
#include "oddity/core/Log.hh"

#include <cmath>

namespace oddity {

namespace {

// Overwrite `target` when `key` is present. A missing key is not an error.
template <typename T> Result<void> readNumber(const DataLoader& loader, std::string_view key, T& target) {
    if (!loader.hasKey(key)) {
        return Result<void>::ok();
    }
    auto value = loader.getFloat(key);
    if (value.isError()) {
        return Result<void>::error(value.code(), value.message());
    }
    if (!std::isfinite(value.value())) {
        return Result<void>::error(ErrorCode::OutOfRange, std::string(key) + " must be finite");
    }
    target = static_cast<T>(value.value());
    return Result<void>::ok();
}

Result<void> readFlag(const DataLoader& loader, std::string_view key, bool& target) {
    if (!loader.hasKey(key)) {
        return Result<void>::ok();
    }
    auto value = loader.getBool(key);
    if (value.isError()) {
        return Result<void>::error(value.code(), value.message());
    }
    target = value.value();
    return Result<void>::ok();
}

Result<void> require(bool condition, std::string_view message) {
    if (condition) {
        return Result<void>::ok();
    }
    return Result<void>::error(ErrorCode::OutOfRange, std::string(message));
}

Result<void> validate(const GameConfig& config) {
    const Result<void> checks[] = {
        require(config.time.maxHistoryMs > 0.0, "time.max_history_ms must be positive"),
        require(config.time.recordIntervalMs >= 0.0, "time.record_interval_ms must not be negative"),
        require(config.time.rewindSpeed > 0.0, "time.rewind_speed must be positive"),
        require(config.player.speed >= 0.0f, "player.speed must not be negative"),
        require(config.player.jumpPower >= 0.0f, "player.jump_power must not be negative"),
        require(config.player.dashCooldownMs >= 0.0f, "player.dash_cooldown_ms must not be negative"),
        require(config.player.dashDurationMs >= 0.0f, "player.dash_duration_ms must not be negative"),
        require(config.player.dashSpeed >= 0.0f, "player.dash_speed must not be negative"),
        require(config.enemy.speed >= 0.0f, "enemy.speed must not be negative"),
        require(config.enemy.patrolDistance >= 0.0f, "enemy.patrol_distance must not be negative"),
        require(config.pulse.cooldownMs >= 0.0f, "pulse.cooldown_ms must not be negative"),
        require(config.pulse.range >= 0.0f, "pulse.range must not be negative"),
        require(config.pulse.durationMs >= 0.0f, "pulse.duration_ms must not be negative"),
    };
    for (const auto& check : checks) {
        if (check.isError()) {
            return Result<void>::error(check.code(), check.message());
        }
    }
    return Result<void>::ok();
}

} // namespace

Result<GameConfig> readGameConfig(const DataLoader& loader) {
    GameConfig config;

    const Result<void> reads[] = {
        readNumber(loader, "time.max_history_ms", config.time.maxHistoryMs),
        readNumber(loader, "time.record_interval_ms", config.time.recordIntervalMs),
        readNumber(loader, "time.rewind_speed", config.time.rewindSpeed),
        readNumber(loader, "player.speed", config.player.speed),
        readNumber(loader, "player.jump_power", config.player.jumpPower),
        readNumber(loader, "player.gravity", config.player.gravity),
        readFlag(loader, "player.rewind_vitals", config.player.rewindVitals),
        readNumber(loader, "player.dash_cooldown_ms", config.player.dashCooldownMs),
        readNumber(loader, "player.dash_duration_ms", config.player.dashDurationMs),
        readNumber(loader, "player.dash_speed", config.player.dashSpeed),
        readNumber(loader, "enemy.speed", config.enemy.speed),
        readNumber(loader, "enemy.patrol_distance", config.enemy.patrolDistance),
        readNumber(loader, "pulse.cooldown_ms", config.pulse.cooldownMs),
        readNumber(loader, "pulse.range", config.pulse.range),
        readNumber(loader, "pulse.duration_ms", config.pulse.durationMs),
        readNumber(loader, "world.floor_y", config.world.floorY),
    };
    for (const auto& read : reads) {
        if (read.isError()) {
            return Result<GameConfig>::error(read.code(), read.message());
        }
    }

    auto valid = validate(config);
    if (valid.isError()) {
        return Result<GameConfig>::error(valid.code(), loader.sourceName() + ": " + valid.message());
    }
    return Result<GameConfig>::ok(config);
}

Result<GameConfig> parseGameConfig(std::string_view tomlContent) {
    auto loader = DataLoader::parse(tomlContent, "<config>");
    if (loader.isError()) {
        return Result<GameConfig>::error(loader.code(), loader.message());
    }
    return readGameConfig(loader.value());
}

Result<GameConfig> loadGameConfig(const std::filesystem::path& path) {
    auto loader = DataLoader::load(path);
    if (loader.isError()) {
        return Result<GameConfig>::error(loader.code(), loader.message());
    }
    auto config = readGameConfig(loader.value());
    if (config.isOk()) {
        ODDITY_LOG_INFO("Loaded game config from {}", path.string());
    }
    return config;
}

} // namespace oddity
