#include "oddity/core/Constants.g.hh"
#include "oddity/core/GameConfig.hh"
#include "oddity/core/Log.hh"
#include "oddity/core/Scene.hh"
#include "oddity/utils/ArgumentParser.hh"

#include <fstream>
#include <iostream>
#include <string>

namespace {

constexpr float kFrameMs = 16.0f;

void logEntity(const char* phase, const oddity::Entity& entity) {
    auto state = entity.captureState();
    ODDITY_LOG_INFO("[{}] {} at ({:.1f}, {:.1f}) v=({:.1f}, {:.1f}) anim={} alive={}", phase, entity.name(), state.x,
                    state.y, state.velocityX, state.velocityY, state.animation.value_or("-"), state.isAlive);
}

void logScene(const char* phase, oddity::Scene& scene) {
    if (auto* player = scene.player()) {
        logEntity(phase, *player);
    }
    for (const auto& enemy : scene.enemies()) {
        logEntity(phase, *enemy);
    }
    for (const auto& platform : scene.platforms()) {
        logEntity(phase, *platform);
    }
    for (const auto& coin : scene.coins()) {
        logEntity(phase, *coin);
    }
    const auto& history = scene.timeManager().history();
    ODDITY_LOG_INFO("[{}] {} snapshots spanning {:.0f} ms, {} coins collected", phase, history.size(), history.span(),
                    scene.coinsCollected());
}

// Advance `durationMs` of game time in fixed frames; returns the new clock.
double run(oddity::Scene& scene, double now, double durationMs) {
    double end = now + durationMs;
    while (now < end) {
        now += kFrameMs;
        scene.update(now, kFrameMs);
    }
    return now;
}

void buildLevel(oddity::Scene& scene) {
    float floorY = scene.config().world.floorY;

    scene.spawnPlayer(100.0f, floorY);

    oddity::PlatformMovement lift;
    lift.type = oddity::MovementType::Linear;
    lift.speed = 60.0f;
    lift.end = oddity::Vec2f(650.0f, floorY - 120.0f);
    lift.autoStart = true;
    scene.spawnPlatform(400.0f, floorY - 120.0f, 192.0f, lift);

    scene.spawnEnemy(600.0f, floorY);
    scene.spawnCoin(260.0f, floorY - 20.0f);
    scene.spawnCoin(380.0f, floorY - 20.0f);
}

void runScenario(oddity::Scene& scene) {
    double now = 0.0;
    scene.update(now, 0.0f);
    logScene("start", scene);

    scene.setPlayerInput({false, true, false});
    now = run(scene, now, 1500.0);
    scene.requestPulse();
    scene.setPlayerInput({false, true, false, true});
    now = run(scene, now, 300.0);
    scene.setPlayerInput({false, true, false});
    now = run(scene, now, 1200.0);
    logScene("forward", scene);

    scene.setPlayerInput({});
    scene.setRewindHeld(true);
    now = run(scene, now, 2000.0);
    logScene("rewound", scene);

    scene.setRewindHeld(false);
    scene.setPlayerInput({false, false, true});
    now = run(scene, now, 1000.0);
    logScene("resumed", scene);
}

bool dumpHistory(const oddity::Scene& scene, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        ODDITY_LOG_ERROR("Cannot open {} for writing", path);
        return false;
    }
    out << scene.timeManager().historyToJson().dump(2) << "\n";
    ODDITY_LOG_INFO("History written to {}", path);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    oddity::log::init();
    ODDITY_LOG_INFO("Starting {} {}", oddity::APP_NAME, oddity::APP_VERSION);

    oddity::ArgumentParser argParser;
    argParser.addArgument("--config", "Load settings from a TOML file", true);
    argParser.addArgument("--dump", "Write the recorded history as JSON", true);
    argParser.addArgument("--version", "Display version information");
    argParser.addArgument("--help", "Display this help message");

    auto parsed = argParser.parse(argc, argv);
    if (parsed.isError() || argParser.hasArgument("--help")) {
        if (parsed.isError()) {
            std::cerr << parsed.message() << std::endl;
        }
        std::cout << "Usage: " << oddity::APP_EXECUTABLE_NAME << " [options]" << std::endl;
        std::cout << "Options:" << std::endl << argParser.usage();
        oddity::log::shutdown();
        return parsed.isError() ? 2 : 0;
    }

    if (argParser.hasArgument("--version")) {
        std::cout << oddity::APP_NAME << " version " << oddity::APP_VERSION << std::endl;
        oddity::log::shutdown();
        return 0;
    }

    try {
        oddity::GameConfig config;
        if (auto path = argParser.getValue("--config")) {
            auto loaded = oddity::loadGameConfig(*path);
            if (loaded.isError()) {
                ODDITY_LOG_CRITICAL("Config error ({}): {}", oddity::errorCodeToString(loaded.code()),
                                    loaded.message());
                oddity::log::shutdown();
                return 1;
            }
            config = loaded.value();
        }

        int exitCode = 0;
        {
            oddity::Scene scene(config);
            buildLevel(scene);
            runScenario(scene);

            if (auto dumpPath = argParser.getValue("--dump")) {
                exitCode = dumpHistory(scene, *dumpPath) ? 0 : 1;
            }
        }

        oddity::log::shutdown();
        return exitCode;

    } catch (const std::exception& e) {
        ODDITY_LOG_ERROR("Fatal: {}", e.what());
        oddity::log::shutdown();
        return 1;
    }
}
