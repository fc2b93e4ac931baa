#include "oddity/core/Entity.hh"

#include "oddity/core/Log.hh"
#include "oddity/core/TimeManager.hh"

namespace oddity {

Entity::Entity(std::string name, float x, float y) : name_(std::move(name)), position_(x, y) {}

Entity::~Entity() {
    unregister();
}

const std::string& Entity::name() const {
    return name_;
}

const Vec2f& Entity::position() const {
    return position_;
}

float Entity::x() const {
    return position_.x;
}

float Entity::y() const {
    return position_.y;
}

void Entity::setPosition(float x, float y) {
    position_ = Vec2f(x, y);
}

void Entity::setOrigin(float ox, float oy) {
    origin_ = Vec2f(ox, oy);
}

Vec2f Entity::origin() const {
    return origin_;
}

bool Entity::isActive() const {
    return active_;
}

void Entity::setActive(bool active) {
    active_ = active;
}

bool Entity::isVisible() const {
    return visible_;
}

void Entity::setVisible(bool visible) {
    visible_ = visible;
}

PhysicsBody& Entity::enableBody(float width, float height) {
    if (!body_) {
        body_ = std::make_unique<PhysicsBody>(width, height);
    } else {
        body_->setSize(width, height);
    }
    return *body_;
}

PhysicsBody* Entity::body() {
    return body_.get();
}

const PhysicsBody* Entity::body() const {
    return body_.get();
}

AnimationPlayer& Entity::enableAnimations() {
    if (!anims_) {
        anims_ = std::make_unique<AnimationPlayer>();
    }
    return *anims_;
}

AnimationPlayer* Entity::animations() {
    return anims_.get();
}

const AnimationPlayer* Entity::animations() const {
    return anims_.get();
}

Rect Entity::bounds() const {
    if (!body_) {
        return Rect(position_, position_);
    }
    float w = body_->width();
    float h = body_->height();
    Vec2f topLeft(position_.x - origin_.x * w, position_.y - origin_.y * h);
    return Rect(topLeft, topLeft + Vec2f(w, h));
}

ObjectId Entity::registerWith(TimeManager& timeManager) {
    if (timeManager_ && timeManager_ != &timeManager) {
        unregister();
    }
    timeManager_ = &timeManager;
    return timeManager.registerObject(*this);
}

void Entity::unregister() {
    if (!timeManager_) {
        return;
    }
    timeManager_->unregisterObject(*this);
    timeManager_ = nullptr;
}

bool Entity::isRegistered() const {
    return timeManager_ != nullptr;
}

void Entity::update(double /*time*/, float deltaMs) {
    integrate(deltaMs);
    if (anims_) {
        anims_->update(deltaMs);
    }
}

EntityState Entity::captureState() const {
    EntityState state;
    state.x = position_.x;
    state.y = position_.y;
    if (body_) {
        state.velocityX = body_->velocity().x;
        state.velocityY = body_->velocity().y;
    }
    state.animation = anims_ ? anims_->currentKey() : std::nullopt;
    state.isAlive = active_;
    state.isVisible = visible_;
    captureFields(state);
    return state;
}

void Entity::applyState(const EntityState& state) {
    position_ = Vec2f(state.x, state.y);
    active_ = state.isAlive;
    visible_ = state.isVisible;
    if (body_) {
        body_->setVelocity(state.velocityX, state.velocityY);
    }
    if (state.animation) {
        playAnimation(*state.animation);
    }
    applyFields(state);
}

void Entity::onRewindToggled(bool rewinding) {
    if (!body_) {
        return;
    }
    if (rewinding) {
        if (!gravityBeforeRewind_) {
            gravityBeforeRewind_ = body_->allowGravity();
        }
        body_->setAllowGravity(false);
    } else if (gravityBeforeRewind_) {
        body_->setAllowGravity(*gravityBeforeRewind_);
        gravityBeforeRewind_.reset();
    }
}

bool Entity::gravitySuspended() const {
    return gravityBeforeRewind_.has_value();
}

void Entity::captureFields(EntityState& /*state*/) const {}

void Entity::applyFields(const EntityState& /*state*/) {}

void Entity::integrate(float deltaMs) {
    if (!body_) {
        return;
    }
    position_ += body_->step(deltaMs);
}

void Entity::playAnimation(const std::string& key, bool ignoreIfPlaying) {
    if (!anims_) {
        return;
    }
    if (!anims_->hasClip(key)) {
        ODDITY_LOG_DEBUG("{}: unknown animation '{}' ignored", name_, key);
        return;
    }
    anims_->play(key, ignoreIfPlaying);
}

} // namespace oddity
