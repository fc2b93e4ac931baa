#include "oddity/core/TemporalState.hh"

#include <array>
#include <cmath>
#include <string_view>

namespace oddity {

namespace {

constexpr std::array<std::string_view, 7> kCommonKeys = {"x",         "y",       "velocityX", "velocityY",
                                                         "animation", "isAlive", "isVisible"};

bool isCommonKey(std::string_view key) {
    for (auto common : kCommonKeys) {
        if (common == key)
            return true;
    }
    return false;
}

float lerp(float a, float b, double f) {
    return static_cast<float>(static_cast<double>(a) * (1.0 - f) + static_cast<double>(b) * f);
}

double lerp(double a, double b, double f) {
    return a * (1.0 - f) + b * f;
}

} // namespace

// --- EntityState ---

void EntityState::set(const std::string& key, StateValue value) {
    fields[key] = std::move(value);
}

bool EntityState::has(const std::string& key) const {
    return fields.find(key) != fields.end();
}

void EntityState::erase(const std::string& key) {
    fields.erase(key);
}

std::optional<double> EntityState::getNumber(const std::string& key) const {
    if (auto d = get<double>(key)) {
        return d;
    }
    if (auto i = get<int64_t>(key)) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

bool isWellFormed(const EntityState& state) {
    if (!std::isfinite(state.x) || !std::isfinite(state.y) || !std::isfinite(state.velocityX) ||
        !std::isfinite(state.velocityY)) {
        return false;
    }
    for (const auto& [key, value] : state.fields) {
        if (const double* d = std::get_if<double>(&value)) {
            if (!std::isfinite(*d))
                return false;
        }
    }
    return true;
}

EntityState interpolateState(const EntityState& earlier, const EntityState& later, double fraction) {
    const EntityState& nearer = fraction >= 0.5 ? later : earlier;

    EntityState result;
    result.x = lerp(earlier.x, later.x, fraction);
    result.y = lerp(earlier.y, later.y, fraction);
    result.velocityX = lerp(earlier.velocityX, later.velocityX, fraction);
    result.velocityY = lerp(earlier.velocityY, later.velocityY, fraction);
    result.animation = nearer.animation;
    result.isAlive = nearer.isAlive;
    result.isVisible = nearer.isVisible;

    // Fields present in both states: lerp continuous ones, pick the rest
    for (const auto& [key, laterValue] : later.fields) {
        auto it = earlier.fields.find(key);
        if (it == earlier.fields.end()) {
            result.fields.emplace(key, laterValue);
            continue;
        }
        const double* a = std::get_if<double>(&it->second);
        const double* b = std::get_if<double>(&laterValue);
        if (a && b) {
            result.fields.emplace(key, lerp(*a, *b, fraction));
        } else {
            result.fields.emplace(key, fraction >= 0.5 ? laterValue : it->second);
        }
    }

    // Fields only the earlier state knows about
    for (const auto& [key, earlierValue] : earlier.fields) {
        result.fields.emplace(key, earlierValue);
    }

    return result;
}

// --- JSON ---

void to_json(nlohmann::json& j, const StateValue& v) {
    std::visit([&j](const auto& value) { j = value; }, v);
}

void to_json(nlohmann::json& j, const EntityState& s) {
    j = nlohmann::json{{"x", s.x},
                       {"y", s.y},
                       {"velocityX", s.velocityX},
                       {"velocityY", s.velocityY},
                       {"isAlive", s.isAlive},
                       {"isVisible", s.isVisible}};
    if (s.animation) {
        j["animation"] = *s.animation;
    } else {
        j["animation"] = nullptr;
    }
    for (const auto& [key, value] : s.fields) {
        if (isCommonKey(key))
            continue;
        nlohmann::json fieldJson;
        to_json(fieldJson, value);
        j[key] = std::move(fieldJson);
    }
}

void from_json(const nlohmann::json& j, EntityState& s) {
    j.at("x").get_to(s.x);
    j.at("y").get_to(s.y);
    j.at("velocityX").get_to(s.velocityX);
    j.at("velocityY").get_to(s.velocityY);
    j.at("isAlive").get_to(s.isAlive);
    j.at("isVisible").get_to(s.isVisible);

    const auto& anim = j.at("animation");
    if (anim.is_null()) {
        s.animation.reset();
    } else {
        s.animation = anim.get<std::string>();
    }

    s.fields.clear();
    for (const auto& [key, value] : j.items()) {
        if (isCommonKey(key))
            continue;
        if (value.is_number_float()) {
            s.fields[key] = value.get<double>();
        } else if (value.is_number_integer()) {
            s.fields[key] = value.get<int64_t>();
        } else if (value.is_boolean()) {
            s.fields[key] = value.get<bool>();
        } else if (value.is_string()) {
            s.fields[key] = value.get<std::string>();
        }
        // null, arrays and objects have no StateValue mapping and are dropped
    }
}

Result<EntityState> parseEntityState(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Result<EntityState>::error(ErrorCode::MalformedState, "entity state must be a JSON object");
    }
    try {
        EntityState state;
        from_json(j, state);
        return Result<EntityState>::ok(std::move(state));
    } catch (const nlohmann::json::exception& e) {
        return Result<EntityState>::error(ErrorCode::MalformedState,
                                          std::string("malformed entity state: ") + e.what());
    }
}

} // namespace oddity
