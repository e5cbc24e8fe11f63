#include "tilemerge/core/GameConfig.hpp"

#include <algorithm>
#include <limits>
#include <type_traits>

namespace tilemerge::core {

namespace {

// Integers are read through double and clamped so that values such as 1e300
// saturate instead of overflowing the conversion.
template <typename T>
T NumberAs(const Json& value) {
    if constexpr (std::is_integral_v<T>) {
        const double raw = value.get<double>();
        const double lo = static_cast<double>(std::numeric_limits<T>::min());
        const double hi = static_cast<double>(std::numeric_limits<T>::max());
        return static_cast<T>(std::clamp(raw, lo, hi));
    } else {
        return value.get<T>();
    }
}

template <typename T>
void ReadNumber(const Json& json, const char* key, T& out) {
    if (json.contains(key) && json[key].is_number()) {
        out = NumberAs<T>(json[key]);
    }
}

// Two-number array such as [min, max]; untouched unless both are numbers.
template <typename T>
void ReadPair(const Json& json, const char* key, T& first, T& second) {
    if (!json.contains(key) || !json[key].is_array() || json[key].size() != 2) {
        return;
    }
    const Json& pair = json[key];
    if (pair[0].is_number() && pair[1].is_number()) {
        first = NumberAs<T>(pair[0]);
        second = NumberAs<T>(pair[1]);
    }
}

Json ParticlesToJson(const ParticleRules& rules) {
    Json json;
    json["burst_count"] = rules.burst_count;
    json["size"] = {rules.size_min, rules.size_max};
    json["speed"] = rules.speed;
    json["life"] = {rules.life_min, rules.life_max};
    json["reference_life"] = rules.reference_life;
    json["life_decay"] = rules.life_decay;
    json["friction"] = rules.friction;
    return json;
}

ParticleRules ParticlesFromJson(const Json& json) {
    ParticleRules rules;
    if (!json.is_object()) {
        return rules;
    }
    ReadNumber(json, "burst_count", rules.burst_count);
    ReadPair(json, "size", rules.size_min, rules.size_max);
    ReadNumber(json, "speed", rules.speed);
    ReadPair(json, "life", rules.life_min, rules.life_max);
    ReadNumber(json, "reference_life", rules.reference_life);
    ReadNumber(json, "life_decay", rules.life_decay);
    ReadNumber(json, "friction", rules.friction);
    return rules;
}

}  // namespace

void GameConfig::EnsureConstraints() {
    window[0] = std::max(200, window[0]);
    window[1] = std::max(200, window[1]);

    session.board_size = std::clamp(session.board_size, kMinBoardSize, kMaxBoardSize);
    auto& geometry = session.geometry;
    geometry.cells = session.board_size;
    geometry.padding = std::max(0.0f, geometry.padding);
    const float min_extent = geometry.padding * static_cast<float>(geometry.cells + 1) +
                             static_cast<float>(geometry.cells);
    geometry.extent = std::max(min_extent, geometry.extent);

    auto& particles = session.particles;
    particles.burst_count = std::clamp(particles.burst_count, 0, 200);
    particles.size_min = std::max(1, particles.size_min);
    particles.size_max = std::max(particles.size_min, particles.size_max);
    particles.speed = std::max(0.0f, particles.speed);
    particles.life_min = std::max(1.0f, particles.life_min);
    particles.life_max = std::max(particles.life_min, particles.life_max);
    if (particles.reference_life <= 0.0f) {
        particles.reference_life = ParticleRules{}.reference_life;
    }
    if (particles.life_decay <= 0.0f) {
        particles.life_decay = ParticleRules{}.life_decay;
    }
    particles.friction = std::max(0.0f, particles.friction);
}

Json GameConfig::ToJson() const {
    Json json;
    json["window"] = {window[0], window[1]};
    json["vsync"] = vsync;
    json["seed"] = seed;

    Json board;
    board["size"] = session.board_size;
    board["left"] = session.geometry.left;
    board["top"] = session.geometry.top;
    board["extent"] = session.geometry.extent;
    board["padding"] = session.geometry.padding;
    json["board"] = board;

    json["particles"] = ParticlesToJson(session.particles);
    return json;
}

GameConfig GameConfig::FromJson(const Json& json) {
    GameConfig config;
    if (!json.is_object()) {
        return config;
    }
    ReadPair(json, "window", config.window[0], config.window[1]);
    if (json.contains("vsync") && json["vsync"].is_boolean()) {
        config.vsync = json["vsync"].get<bool>();
    }
    if (json.contains("seed") && json["seed"].is_number_unsigned()) {
        config.seed = json["seed"].get<std::uint32_t>();
    }
    if (json.contains("board") && json["board"].is_object()) {
        const Json& board = json["board"];
        ReadNumber(board, "size", config.session.board_size);
        ReadNumber(board, "left", config.session.geometry.left);
        ReadNumber(board, "top", config.session.geometry.top);
        ReadNumber(board, "extent", config.session.geometry.extent);
        ReadNumber(board, "padding", config.session.geometry.padding);
    }
    if (json.contains("particles")) {
        config.session.particles = ParticlesFromJson(json["particles"]);
    }
    config.EnsureConstraints();
    return config;
}

std::string GameConfig::Serialize() const {
    return ToJson().dump(2);
}

GameConfig GameConfig::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

}  // namespace tilemerge::core
