#pragma once

#include "oddity/core/AnimationPlayer.hh"
#include "oddity/core/PhysicsBody.hh"
#include "oddity/core/Spatial.hh"
#include "oddity/core/TemporalState.hh"

#include <memory>
#include <optional>
#include <string>

namespace oddity {

class TimeManager;

/**
 * @brief Base class for every rewindable game object
 *
 * Holds the sprite-level data the temporal core cares about (position,
 * active/visible flags) plus an optional physics body and animation player.
 * captureState()/applyState() handle the common fields; subclasses add their
 * own through captureFields()/applyFields().
 *
 * An entity registered with a TimeManager unregisters itself on destruction,
 * so the manager must outlive it.
 */
class Entity : public TemporalObject {
  public:
    Entity(std::string name, float x, float y);
    ~Entity() override;

    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;

    const std::string& name() const;

    const Vec2f& position() const;
    float x() const;
    float y() const;
    void setPosition(float x, float y);

    // Anchor of position() inside the bounds, (0.5, 0.5) is the centre and
    // (0.5, 1) the middle of the bottom edge.
    void setOrigin(float ox, float oy);
    Vec2f origin() const;

    bool isActive() const;
    void setActive(bool active);
    bool isVisible() const;
    void setVisible(bool visible);

    PhysicsBody& enableBody(float width, float height);
    PhysicsBody* body();
    const PhysicsBody* body() const;

    AnimationPlayer& enableAnimations();
    AnimationPlayer* animations();
    const AnimationPlayer* animations() const;

    virtual Rect bounds() const;

    ObjectId registerWith(TimeManager& timeManager);
    void unregister();
    bool isRegistered() const;

    virtual void update(double time, float deltaMs);

    EntityState captureState() const final;
    void applyState(const EntityState& state) final;

    // Gravity is suspended while time flows backwards and restored after.
    // Only an entity that saw the start of the rewind restores anything.
    void onRewindToggled(bool rewinding) override;

  protected:
    virtual void captureFields(EntityState& state) const;
    virtual void applyFields(const EntityState& state);

    // Advance position by the body's displacement for this frame.
    void integrate(float deltaMs);

    // True between the enter and exit rewind notifications.
    bool gravitySuspended() const;

    // play() that tolerates a missing player or clip
    void playAnimation(const std::string& key, bool ignoreIfPlaying = true);

  private:
    std::string name_;
    Vec2f position_;
    Vec2f origin_{0.5f, 0.5f};
    bool active_ = true;
    bool visible_ = true;

    std::unique_ptr<PhysicsBody> body_;
    std::unique_ptr<AnimationPlayer> anims_;

    TimeManager* timeManager_ = nullptr;
    std::optional<bool> gravityBeforeRewind_;
};

} // namespace oddity
