#include "oddity/entities/Coin.hh"

namespace oddity {

Coin::Coin(float x, float y) : Entity("coin", x, y) {
    enableBody(kSize, kSize).setAllowGravity(false);
}

bool Coin::collect() {
    if (collected_) {
        return false;
    }
    collected_ = true;
    setActive(false);
    setVisible(false);
    return true;
}

bool Coin::isCollected() const {
    return collected_;
}

void Coin::captureFields(EntityState& state) const {
    state.set("isCollected", collected_);
}

void Coin::applyFields(const EntityState& state) {
    if (auto collected = state.get<bool>("isCollected")) {
        collected_ = *collected;
    } else {
        collected_ = !state.isAlive;
    }
}

} // namespace oddity
