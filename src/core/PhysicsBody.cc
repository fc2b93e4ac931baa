#include "oddity/core/PhysicsBody.hh"

namespace oddity {

PhysicsBody::PhysicsBody(float width, float height) : width_(width), height_(height) {}

const Vec2f& PhysicsBody::velocity() const {
    return velocity_;
}

void PhysicsBody::setVelocity(float vx, float vy) {
    velocity_ = Vec2f(vx, vy);
}

void PhysicsBody::setVelocityX(float vx) {
    velocity_.x = vx;
}

void PhysicsBody::setVelocityY(float vy) {
    velocity_.y = vy;
}

float PhysicsBody::gravity() const {
    return gravity_;
}

void PhysicsBody::setGravity(float pixelsPerSecondSq) {
    gravity_ = pixelsPerSecondSq;
}

bool PhysicsBody::allowGravity() const {
    return allowGravity_;
}

void PhysicsBody::setAllowGravity(bool allow) {
    allowGravity_ = allow;
}

bool PhysicsBody::immovable() const {
    return immovable_;
}

void PhysicsBody::setImmovable(bool immovable) {
    immovable_ = immovable;
}

TouchingFlags& PhysicsBody::touching() {
    return touching_;
}

const TouchingFlags& PhysicsBody::touching() const {
    return touching_;
}

float PhysicsBody::width() const {
    return width_;
}

float PhysicsBody::height() const {
    return height_;
}

void PhysicsBody::setSize(float width, float height) {
    width_ = width;
    height_ = height;
}

Vec2f PhysicsBody::step(float deltaMs) {
    float dt = deltaMs / 1000.0f;
    if (allowGravity_ && !immovable_) {
        velocity_.y += gravity_ * dt;
    }
    return velocity_ * dt;
}

} // namespace oddity
