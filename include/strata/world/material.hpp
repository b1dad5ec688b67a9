#pragma once

#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace strata::world {

using Properties = std::map<std::string, std::string>;

// Block identifier plus its property state.
struct Material {
    std::string name = "air";
    Properties properties;

    Material() = default;
    explicit Material(std::string block_name, Properties props = {})
        : name(std::move(block_name))
        , properties(std::move(props))
    {}

    [[nodiscard]] bool is_air() const noexcept {
        return name == "air" || name == "cave_air" || name == "void_air";
    }
};

inline bool operator==(const Material& a, const Material& b) {
    return a.name == b.name && a.properties == b.properties;
}
inline bool operator!=(const Material& a, const Material& b) { return !(a == b); }
inline bool operator<(const Material& a, const Material& b) {
    if (a.name != b.name) {
        return a.name < b.name;
    }
    return a.properties < b.properties;
}

inline Material air() { return Material{}; }

// "oak_stairs[facing=east,half=bottom]"; properties are emitted in key order.
// For display and hand-written input only: values containing ',', '=' or ']'
// do not survive the round trip.
std::string to_block_string(const Material& material);

// Inverse of to_block_string. Throws std::invalid_argument on malformed input.
Material parse_block_string(std::string_view text);

} // namespace strata::world
