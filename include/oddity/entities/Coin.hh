#pragma once

#include "oddity/core/Entity.hh"

namespace oddity {

// Collectible. Picking it up hides it; rewinding to before the pickup brings
// it back. The scene's coin counter is not part of the recorded state.
class Coin : public Entity {
  public:
    static constexpr float kSize = 24.0f;

    Coin(float x, float y);

    /// Returns false if the coin was already collected.
    bool collect();
    bool isCollected() const;

  protected:
    void captureFields(EntityState& state) const override;
    void applyFields(const EntityState& state) override;

  private:
    bool collected_ = false;
};

} // namespace oddity
