#include "oddity/core/Scene.hh"

#include "oddity/core/Log.hh"

#include <algorithm>

namespace oddity {

namespace {

constexpr float kLandingTolerance = 2.0f;

template <typename T> bool eraseOwned(std::vector<std::unique_ptr<T>>& owned, const Entity& entity) {
    auto it = std::find_if(owned.begin(), owned.end(), [&](const auto& ptr) { return ptr.get() == &entity; });
    if (it == owned.end()) {
        return false;
    }
    owned.erase(it);
    return true;
}

} // namespace

Scene::Scene(GameConfig config) : config_(config), timeManager_(config.time), pulse_(config.pulse) {
    ODDITY_LOG_DEBUG("Scene created (floor at y={})", config_.world.floorY);
}

Scene::~Scene() {
    timeManager_.clearHistory();
    ODDITY_LOG_DEBUG("Scene torn down");
}

Player& Scene::spawnPlayer(float x, float y) {
    player_ = std::make_unique<Player>(x, y, config_.player);
    player_->registerWith(timeManager_);
    return *player_;
}

PatrolEnemy& Scene::spawnEnemy(float x, float y) {
    auto& enemy = *enemies_.emplace_back(std::make_unique<PatrolEnemy>(x, y, config_.enemy));
    enemy.registerWith(timeManager_);
    return enemy;
}

MovingPlatform& Scene::spawnPlatform(float x, float y, float width, PlatformMovement movement) {
    auto& platform = *platforms_.emplace_back(std::make_unique<MovingPlatform>(x, y, width, std::move(movement)));
    platform.registerWith(timeManager_);
    return platform;
}

Coin& Scene::spawnCoin(float x, float y) {
    auto& coin = *coins_.emplace_back(std::make_unique<Coin>(x, y));
    coin.registerWith(timeManager_);
    return coin;
}

bool Scene::destroyEntity(const Entity& entity) {
    if (player_.get() == &entity) {
        player_.reset();
        return true;
    }
    return eraseOwned(enemies_, entity) || eraseOwned(platforms_, entity) || eraseOwned(coins_, entity);
}

void Scene::setPlayerInput(const PlayerInput& input) {
    if (player_) {
        player_->setInput(input);
    }
}

void Scene::setRewindHeld(bool held) {
    if (held == rewindHeld_) {
        return;
    }
    rewindHeld_ = held;
    timeManager_.toggleRewind(held);
}

void Scene::requestPulse() {
    pulseRequested_ = true;
}

void Scene::update(double now, float deltaMs) {
    // While rewinding, the time manager alone drives every entity
    if (!timeManager_.isRewinding()) {
        stepForward(now, deltaMs);
    }
    timeManager_.update(now, deltaMs);
}

void Scene::stepForward(double now, float deltaMs) {
    for (auto& platform : platforms_) {
        platform->update(now, deltaMs);
        if (player_) {
            platform->carryIfStanding(*player_);
        }
    }

    if (player_ && player_->isActive()) {
        float previousBottom = player_->bounds().bottom();
        player_->update(now, deltaMs);
        resolvePlayerSupport(previousBottom);
        player_->refreshAnimation();
    }

    for (auto& enemy : enemies_) {
        enemy->update(now, deltaMs);
    }

    resolveContacts(now);

    if (player_) {
        pulse_.setPosition(player_->position());
    }
    if (pulseRequested_) {
        firePulse(now);
        pulseRequested_ = false;
    }
}

void Scene::resolvePlayerSupport(float previousBottom) {
    const auto* body = player_->body();
    if (body->velocity().y < 0.0f) {
        return;
    }

    Rect feet = player_->bounds();
    float surface = config_.world.floorY;
    bool supported = feet.bottom() >= surface;

    for (const auto& platform : platforms_) {
        if (!platform->isActive()) {
            continue;
        }
        for (int32_t i = 0; i < platform->segmentCount(); ++i) {
            Rect tile = platform->segmentBounds(i);
            bool crossedTop = previousBottom <= tile.top() + kLandingTolerance && feet.bottom() >= tile.top();
            if (tile.overlapsHorizontally(feet) && crossedTop && (!supported || tile.top() < surface)) {
                surface = tile.top();
                supported = true;
            }
        }
    }

    if (supported) {
        player_->land(surface);
    }
}

void Scene::resolveContacts(double now) {
    if (!player_ || !player_->isActive()) {
        return;
    }
    Rect playerBounds = player_->bounds();

    for (auto& coin : coins_) {
        if (coin->isActive() && coin->bounds().intersects(playerBounds) && coin->collect()) {
            ++coinsCollected_;
            ODDITY_LOG_DEBUG("Coin collected ({} total)", coinsCollected_);
        }
    }

    for (auto& enemy : enemies_) {
        if (!enemy->isActive() || enemy->isFrozen()) {
            continue;
        }
        if (enemy->bounds().intersects(playerBounds)) {
            player_->takeDamage(enemy->contactDamage(), now);
        }
    }
}

void Scene::firePulse(double now) {
    std::vector<PatrolEnemy*> targets;
    targets.reserve(enemies_.size());
    for (auto& enemy : enemies_) {
        targets.push_back(enemy.get());
    }
    pulse_.activate(now, targets);
}

TimeManager& Scene::timeManager() {
    return timeManager_;
}

const TimeManager& Scene::timeManager() const {
    return timeManager_;
}

Player* Scene::player() {
    return player_.get();
}

const std::vector<std::unique_ptr<PatrolEnemy>>& Scene::enemies() const {
    return enemies_;
}

const std::vector<std::unique_ptr<MovingPlatform>>& Scene::platforms() const {
    return platforms_;
}

const std::vector<std::unique_ptr<Coin>>& Scene::coins() const {
    return coins_;
}

ChronoPulse& Scene::chronoPulse() {
    return pulse_;
}

uint32_t Scene::coinsCollected() const {
    return coinsCollected_;
}

const GameConfig& Scene::config() const {
    return config_;
}

} // namespace oddity
