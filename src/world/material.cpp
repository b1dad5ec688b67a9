#include "strata/world/material.hpp"

#include <stdexcept>
#include <string>

namespace strata::world {

std::string to_block_string(const Material& material) {
    std::string out = material.name;
    if (material.properties.empty()) {
        return out;
    }
    out += '[';
    bool first = true;
    for (const auto& [key, value] : material.properties) {
        if (!first) {
            out += ',';
        }
        first = false;
        out += key;
        out += '=';
        out += value;
    }
    out += ']';
    return out;
}

Material parse_block_string(std::string_view text) {
    const auto open = text.find('[');
    if (open == std::string_view::npos) {
        if (text.empty() || text.find(']') != std::string_view::npos) {
            throw std::invalid_argument("malformed block string: '" + std::string(text) + "'");
        }
        return Material{std::string(text)};
    }
    if (open == 0 || text.back() != ']') {
        throw std::invalid_argument("malformed block string: '" + std::string(text) + "'");
    }

    Material material{std::string(text.substr(0, open))};
    std::string_view body = text.substr(open + 1, text.size() - open - 2);
    while (!body.empty()) {
        const auto comma = body.find(',');
        const std::string_view entry = body.substr(0, comma);
        const auto eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            throw std::invalid_argument("malformed block property: '" + std::string(entry) + "'");
        }
        material.properties[std::string(entry.substr(0, eq))] = std::string(entry.substr(eq + 1));
        if (comma == std::string_view::npos) {
            break;
        }
        body.remove_prefix(comma + 1);
    }
    return material;
}

} // namespace strata::world
