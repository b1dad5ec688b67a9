#include "strata/world/name_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace strata::world {

namespace {

constexpr std::string_view kNamespacePrefix = "minecraft:";

std::string normalize(std::string_view name) {
    while (!name.empty() && std::isspace(static_cast<unsigned char>(name.front()))) {
        name.remove_prefix(1);
    }
    while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back()))) {
        name.remove_suffix(1);
    }

    std::string out(name);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    std::replace(out.begin(), out.end(), ' ', '_');

    if (out.compare(0, kNamespacePrefix.size(), kNamespacePrefix) == 0) {
        out.erase(0, kNamespacePrefix.size());
    }
    return out;
}

} // namespace

std::map<std::string, std::string> default_block_aliases() {
    return {
        {"glass_panel", "glass_pane"},
        {"glasspane", "glass_pane"},
        {"planks", "oak_planks"},
        {"wood_planks", "oak_planks"},
        {"wooden_planks", "oak_planks"},
        {"log", "oak_log"},
        {"wood", "oak_log"},
        {"cobble", "cobblestone"},
        {"stone_brick", "stone_bricks"},
        {"brick", "bricks"},
        {"grass", "short_grass"},
        {"grass_path", "dirt_path"},
        {"path", "dirt_path"},
        {"slab", "oak_slab"},
        {"stairs", "oak_stairs"},
        {"door", "oak_door"},
        {"leaves", "oak_leaves"},
        {"lamp", "glowstone"},
        {"sea_lamp", "sea_lantern"},
        {"quartz_pilar", "quartz_pillar"},
        {"smoothstone", "smooth_stone"},
        {"deepslate_brick", "deepslate_bricks"},
    };
}

AliasNameResolver::AliasNameResolver()
    : AliasNameResolver(default_block_aliases())
{}

AliasNameResolver::AliasNameResolver(std::map<std::string, std::string> aliases)
    : aliases_(std::move(aliases))
{}

std::string AliasNameResolver::correct(std::string_view name) const {
    auto it = aliases_.find(normalize(name));
    if (it != aliases_.end()) {
        return it->second;
    }
    return std::string(name);
}

void AliasNameResolver::add_alias(std::string alias, std::string canonical) {
    aliases_.insert_or_assign(normalize(alias), std::move(canonical));
}

Material resolve(const INameResolver& resolver, const Material& material) {
    return Material{resolver.correct(material.name), material.properties};
}

} // namespace strata::world
