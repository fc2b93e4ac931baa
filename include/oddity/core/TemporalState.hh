#pragma once

#include "oddity/utils/ErrorHandling.hh"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace oddity {

/**
 * @brief Value of a type-specific state field
 *
 * double is continuous and interpolated during playback. int64_t, bool and
 * std::string are discrete and taken from the nearer snapshot.
 */
using StateValue = std::variant<double, int64_t, bool, std::string>;

/// Handle assigned by TimeManager at registration. Never reused.
using ObjectId = uint64_t;

/**
 * @brief Snapshot of one object's rewind-relevant fields at one instant
 *
 * Plain value type: no engine object identity leaks into it. The common
 * fields are always present; type-specific fields live in `fields` and may
 * be missing, in which case appliers keep their current value.
 */
struct EntityState {
    float x = 0.0f;
    float y = 0.0f;
    float velocityX = 0.0f;
    float velocityY = 0.0f;
    std::optional<std::string> animation;
    bool isAlive = true;
    bool isVisible = true;
    std::map<std::string, StateValue> fields;

    void set(const std::string& key, StateValue value);
    bool has(const std::string& key) const;
    void erase(const std::string& key);

    // Returns the field only when present with exactly type T.
    template <typename T> std::optional<T> get(const std::string& key) const {
        auto it = fields.find(key);
        if (it == fields.end()) {
            return std::nullopt;
        }
        if (const T* value = std::get_if<T>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }

    // Numeric read that accepts both double and int64_t fields.
    std::optional<double> getNumber(const std::string& key) const;

    bool operator==(const EntityState& other) const = default;
};

/// True when every numeric field is finite. A state failing this check was
/// produced by a broken captureState() implementation.
bool isWellFormed(const EntityState& state);

/// Interpolate between an earlier and a later state.
/// `fraction` is 0 at `earlier` and 1 at `later`. Continuous fields are
/// lerped; discrete fields come from the nearer state, ties favouring `later`.
EntityState interpolateState(const EntityState& earlier, const EntityState& later, double fraction);

/**
 * @brief Temporal State Contract
 *
 * Every rewindable object implements this interface. The TimeManager only
 * ever talks to objects through it and never touches their physics bodies or
 * animation players directly.
 */
class TemporalObject {
  public:
    virtual ~TemporalObject() = default;

    /// Pure read of the current state. Must not throw: absent sub-components
    /// are reported through documented defaults.
    virtual EntityState captureState() const = 0;

    /// Write a (possibly interpolated) state back. Missing type-specific
    /// fields leave the corresponding live values untouched.
    virtual void applyState(const EntityState& state) = 0;

    /// Called when the time manager enters or leaves rewind mode.
    virtual void onRewindToggled(bool /*rewinding*/) {}
};

// --- ADL JSON serialization (nlohmann convention) ---
// Flat schema: x, y, velocityX, velocityY, animation (string|null), isAlive,
// isVisible, then every type-specific field as a top-level key.

void to_json(nlohmann::json& j, const StateValue& v);

void to_json(nlohmann::json& j, const EntityState& s);
void from_json(const nlohmann::json& j, EntityState& s);

/// Non-throwing parse. Fails with MalformedState when a common field is missing
/// or has the wrong type.
Result<EntityState> parseEntityState(const nlohmann::json& j);

} // namespace oddity
