#include "oddity/entities/MovingPlatform.hh"

#include "oddity/core/Log.hh"
#include "oddity/utils/ErrorHandling.hh"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace oddity {

namespace {

constexpr float kTwoPi = 2.0f * std::numbers::pi_v<float>;
constexpr float kStandTolerance = 2.0f;

float normalizeAngle(float angle) {
    angle = std::fmod(angle, kTwoPi);
    if (angle < 0.0f) {
        angle += kTwoPi;
    }
    return angle;
}

int32_t segmentsForWidth(float width) {
    return std::max(1, static_cast<int32_t>(std::ceil(width / MovingPlatform::kTileWidth)));
}

} // namespace

std::string_view movementTypeToString(MovementType type) {
    switch (type) {
        case MovementType::Linear:
            return "linear";
        case MovementType::Circular:
            return "circular";
        case MovementType::Path:
            return "path";
    }
    return "linear";
}

std::optional<MovementType> movementTypeFromString(std::string_view name) {
    if (name == "linear") {
        return MovementType::Linear;
    }
    if (name == "circular") {
        return MovementType::Circular;
    }
    if (name == "path") {
        return MovementType::Path;
    }
    return std::nullopt;
}

MovingPlatform::MovingPlatform(float x, float y, float width, PlatformMovement movement)
    : Entity("platform", x, y),
      type_(movement.type),
      mode_(movement.mode),
      speed_(std::clamp(movement.speed, kMinSpeed, kMaxSpeed)),
      start_(movement.start.value_or(Vec2f(x, y))),
      end_(movement.end.value_or(Vec2f(x + 200.0f, y))),
      center_(movement.center.value_or(Vec2f(x, y))),
      radius_(movement.radius),
      angle_(normalizeAngle(movement.startAngle)),
      path_(std::move(movement.path)),
      loop_(movement.loop),
      target_(start_) {
    if (type_ == MovementType::Circular && radius_ <= 0.0f) {
        throwError("MovingPlatform: circular radius must be positive");
    }

    auto& body = enableBody(kTileWidth, kTileHeight);
    body.setImmovable(true);
    body.setAllowGravity(false);

    if (type_ == MovementType::Circular) {
        setPosition(center_.x + radius_ * std::cos(angle_), center_.y + radius_ * std::sin(angle_));
    }

    width_ = std::max(width, 1.0f);
    rebuildSegments();
    previous_ = position();

    if (movement.autoStart) {
        start();
    }
}

void MovingPlatform::start() {
    moving_ = true;
    switch (type_) {
        case MovementType::Linear:
            moveToTarget(direction_ == 1 ? end_ : start_);
            break;
        case MovementType::Circular:
            break;
        case MovementType::Path:
            if (path_.empty()) {
                moving_ = false;
                return;
            }
            pathIndex_ = std::clamp(pathIndex_, 0, static_cast<int32_t>(path_.size()) - 1);
            moveToTarget(path_[pathIndex_]);
            break;
    }
}

void MovingPlatform::stop() {
    moving_ = false;
    movingToTarget_ = false;
    body()->setVelocity(0.0f, 0.0f);
}

bool MovingPlatform::isMoving() const {
    return moving_;
}

bool MovingPlatform::isMovingToTarget() const {
    return movingToTarget_;
}

void MovingPlatform::update(double /*time*/, float deltaMs) {
    if (moving_) {
        advance(deltaMs);
    }

    if (resyncPending_) {
        frameDelta_ = Vec2f();
        resyncPending_ = false;
    } else {
        frameDelta_ = position() - previous_;
    }
    previous_ = position();
    syncSegments();
}

void MovingPlatform::advance(float deltaMs) {
    switch (type_) {
        case MovementType::Linear:
        case MovementType::Path:
            stepTowardTarget(deltaMs);
            break;
        case MovementType::Circular:
            stepCircular(deltaMs);
            break;
    }
}

void MovingPlatform::stepTowardTarget(float deltaMs) {
    if (!movingToTarget_) {
        return;
    }

    Vec2f toTarget = target_ - position();
    float distance = toTarget.length();
    float step = speed_ * deltaMs / 1000.0f;
    if (distance > 0.0f && step > 0.0f) {
        // Never step past the target
        Vec2f move = step >= distance ? toTarget : toTarget / distance * step;
        setPosition(x() + move.x, y() + move.y);
        distance = (target_ - position()).length();
    }

    if (distance < kTargetTolerance) {
        onTargetReached();
    }
}

void MovingPlatform::stepCircular(float deltaMs) {
    float dt = deltaMs / 1000.0f;
    angle_ = normalizeAngle(angle_ + speed_ / radius_ * dt);

    Vec2f next(center_.x + radius_ * std::cos(angle_), center_.y + radius_ * std::sin(angle_));
    if (dt > 0.0f) {
        Vec2f velocity = (next - position()) / dt;
        body()->setVelocity(velocity.x, velocity.y);
    }
    setPosition(next.x, next.y);
}

void MovingPlatform::moveToTarget(const Vec2f& target) {
    target_ = target;
    movingToTarget_ = true;

    Vec2f toTarget = target_ - position();
    float distance = toTarget.length();
    if (distance > 0.0f) {
        Vec2f velocity = toTarget / distance * speed_;
        body()->setVelocity(velocity.x, velocity.y);
    }
}

void MovingPlatform::onTargetReached() {
    movingToTarget_ = false;
    body()->setVelocity(0.0f, 0.0f);
    if (!moving_) {
        return;
    }

    if (type_ == MovementType::Linear) {
        handleLinearTargetReached();
    } else if (type_ == MovementType::Path) {
        advancePath();
    }
}

void MovingPlatform::handleLinearTargetReached() {
    if (mode_ == LinearMode::Bounce) {
        if ((direction_ == 1 && isNear(end_)) || (direction_ == -1 && isNear(start_))) {
            direction_ = -direction_;
        }
    } else if (direction_ == 1 && isNear(end_)) {
        setPosition(start_.x, start_.y);
    }
    moveToTarget(direction_ == 1 ? end_ : start_);
}

void MovingPlatform::advancePath() {
    if (path_.empty()) {
        moving_ = false;
        return;
    }

    int32_t next = pathIndex_ + 1;
    if (next >= static_cast<int32_t>(path_.size())) {
        if (!loop_) {
            moving_ = false;
            return;
        }
        next = 0;
    }
    pathIndex_ = next;
    moveToTarget(path_[pathIndex_]);
}

bool MovingPlatform::isNear(const Vec2f& point) const {
    return std::abs(x() - point.x) < kTargetTolerance && std::abs(y() - point.y) < kTargetTolerance;
}

MovementType MovingPlatform::movementType() const {
    return type_;
}

float MovingPlatform::speed() const {
    return speed_;
}

int32_t MovingPlatform::direction() const {
    return direction_;
}

float MovingPlatform::angle() const {
    return angle_;
}

int32_t MovingPlatform::currentPathIndex() const {
    return pathIndex_;
}

Vec2f MovingPlatform::target() const {
    return target_;
}

// --- Composite structure ---

float MovingPlatform::width() const {
    return width_;
}

void MovingPlatform::setWidth(float width) {
    width_ = std::max(width, 1.0f);
    int32_t previousCount = segmentCount_;
    rebuildSegments();
    if (segmentCount_ != previousCount) {
        ODDITY_LOG_DEBUG("Platform resized to {} px ({} -> {} segments)", width_, previousCount, segmentCount_);
    }
}

int32_t MovingPlatform::segmentCount() const {
    return segmentCount_;
}

Vec2f MovingPlatform::segmentPosition(int32_t index) const {
    LocalVec2f offset(static_cast<float>(index) * kTileWidth, 0.0f);
    return position() + offset.as<Space::World>();
}

const std::vector<Vec2f>& MovingPlatform::segmentPositions() const {
    return segments_;
}

Rect MovingPlatform::segmentBounds(int32_t index) const {
    return Rect::fromCenter(segmentPosition(index), kTileWidth, kTileHeight);
}

Rect MovingPlatform::bounds() const {
    Rect first = segmentBounds(0);
    Rect last = segmentBounds(segmentCount_ - 1);
    return Rect(first.min, last.max);
}

void MovingPlatform::rebuildSegments() {
    segmentCount_ = segmentsForWidth(width_);
    segments_.assign(static_cast<size_t>(segmentCount_), Vec2f());
    syncSegments();
}

void MovingPlatform::syncSegments() {
    for (int32_t i = 0; i < segmentCount_; ++i) {
        segments_[static_cast<size_t>(i)] = segmentPosition(i);
    }
}

void MovingPlatform::resync() {
    previous_ = position();
    frameDelta_ = Vec2f();
    resyncPending_ = true;
}

// --- Carrying ---

Vec2f MovingPlatform::frameDelta() const {
    return frameDelta_;
}

bool MovingPlatform::isStandingOn(const Entity& rider) const {
    if (!rider.body() || !rider.isActive()) {
        return false;
    }
    Rect feet = rider.bounds();
    for (int32_t i = 0; i < segmentCount_; ++i) {
        Rect tile = segmentBounds(i);
        if (tile.overlapsHorizontally(feet) && std::abs(feet.bottom() - tile.top()) <= kStandTolerance) {
            return true;
        }
    }
    return false;
}

bool MovingPlatform::carryIfStanding(Entity& rider) const {
    if (!rider.body() || !rider.isActive()) {
        return false;
    }
    if (frameDelta_.x == 0.0f && frameDelta_.y == 0.0f) {
        return false;
    }

    // Test against where the segments were before this frame's move
    Rect feet = rider.bounds();
    bool standing = false;
    for (int32_t i = 0; i < segmentCount_ && !standing; ++i) {
        Rect tile = Rect::fromCenter(segmentPosition(i) - frameDelta_, kTileWidth, kTileHeight);
        standing = tile.overlapsHorizontally(feet) && std::abs(feet.bottom() - tile.top()) <= kStandTolerance;
    }
    if (!standing) {
        return false;
    }

    rider.setPosition(rider.x() + frameDelta_.x, rider.y() + frameDelta_.y);
    return true;
}

void MovingPlatform::onRewindToggled(bool rewinding) {
    Entity::onRewindToggled(rewinding);
    if (!rewinding) {
        resync();
    }
}

// --- Temporal State Contract ---

void MovingPlatform::captureFields(EntityState& state) const {
    state.set("movementType", std::string(movementTypeToString(type_)));
    state.set("isMoving", moving_);
    state.set("isMovingToTarget", movingToTarget_);
    state.set("direction", static_cast<int64_t>(direction_));
    state.set("currentPathIndex", static_cast<int64_t>(pathIndex_));
    state.set("segmentCount", static_cast<int64_t>(segmentCount_));
    state.set("angle", static_cast<double>(angle_));
    state.set("targetX", static_cast<double>(target_.x));
    state.set("targetY", static_cast<double>(target_.y));
    state.set("width", static_cast<double>(width_));
    state.set("masterX", static_cast<double>(x()));
    state.set("masterY", static_cast<double>(y()));
}

void MovingPlatform::applyFields(const EntityState& state) {
    if (auto name = state.get<std::string>("movementType")) {
        if (auto type = movementTypeFromString(*name)) {
            type_ = *type;
        } else {
            ODDITY_LOG_WARN("Platform state has unknown movement type '{}'", *name);
        }
    }
    if (auto moving = state.get<bool>("isMoving")) {
        moving_ = *moving;
    }
    if (auto toTarget = state.get<bool>("isMovingToTarget")) {
        movingToTarget_ = *toTarget;
    }
    if (auto dir = state.get<int64_t>("direction")) {
        direction_ = *dir < 0 ? -1 : 1;
    }
    if (auto index = state.get<int64_t>("currentPathIndex")) {
        int64_t last = path_.empty() ? 0 : static_cast<int64_t>(path_.size()) - 1;
        if (*index < 0 || *index > last) {
            ODDITY_LOG_WARN("Platform state path index {} outside [0, {}], clamped", *index, last);
        }
        pathIndex_ = static_cast<int32_t>(std::clamp<int64_t>(*index, 0, last));
    }
    if (auto a = state.getNumber("angle")) {
        angle_ = normalizeAngle(static_cast<float>(*a));
    }
    if (auto tx = state.getNumber("targetX")) {
        target_.x = static_cast<float>(*tx);
    }
    if (auto ty = state.getNumber("targetY")) {
        target_.y = static_cast<float>(*ty);
    }

    // Structure: width is authoritative, segmentCount only fills in for
    // states that carry no width.
    if (auto w = state.getNumber("width")) {
        if (static_cast<float>(*w) != width_) {
            setWidth(static_cast<float>(*w));
        }
    } else if (auto count = state.get<int64_t>("segmentCount")) {
        if (static_cast<int32_t>(*count) != segmentCount_) {
            setWidth(static_cast<float>(*count) * kTileWidth);
        }
    }

    if (auto mx = state.getNumber("masterX")) {
        setPosition(static_cast<float>(*mx), y());
    }
    if (auto my = state.getNumber("masterY")) {
        setPosition(x(), static_cast<float>(*my));
    }

    // A lerped angle is meaningless across the 2*pi wrap. The lerped master
    // lies on the chord of the shorter arc, so the phase is read back from it.
    if (type_ == MovementType::Circular) {
        Vec2f offset = position() - center_;
        if (offset.lengthSquared() > 0.0f) {
            angle_ = normalizeAngle(std::atan2(offset.y, offset.x));
        }
    }

    syncSegments();
    resync();
}

} // namespace oddity
