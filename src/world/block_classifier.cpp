#include "strata/world/block_classifier.hpp"

#include <utility>

namespace strata::world {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

const char* to_string(Classification c) noexcept {
    switch (c) {
    case Classification::Open:      return "open";
    case Classification::Structure: return "structure";
    case Classification::Water:     return "water";
    case Classification::Steep:     return "steep";
    }
    return "unknown";
}

bool BlockCatalog::matches(const std::string& name) const {
    if (names.count(name) != 0) {
        return true;
    }
    for (const auto& suffix : suffixes) {
        if (ends_with(name, suffix)) {
            return true;
        }
    }
    return false;
}

BlockCatalog default_vegetation_catalog() {
    BlockCatalog c;
    c.names = {
        "short_grass", "grass", "tall_grass", "fern", "large_fern", "dead_bush",
        "dandelion", "poppy", "blue_orchid", "allium", "azure_bluet", "oxeye_daisy",
        "cornflower", "lily_of_the_valley", "sunflower", "lilac", "rose_bush", "peony",
        "vine", "cocoa", "sweet_berry_bush", "bamboo", "sugar_cane", "cactus",
        "brown_mushroom", "red_mushroom", "brown_mushroom_block", "red_mushroom_block",
        "mushroom_stem", "moss_carpet", "azalea", "flowering_azalea", "lily_pad",
        "pink_petals", "glow_lichen", "hanging_roots", "snow",
    };
    c.suffixes = {"_leaves", "_log", "_wood", "_tulip", "_sapling", "_stem", "_hyphae", "_vines", "_roots"};
    return c;
}

BlockCatalog default_structure_catalog() {
    BlockCatalog c;
    c.names = {
        "cobblestone", "mossy_cobblestone", "bricks", "glass", "glass_pane", "bookshelf",
        "crafting_table", "furnace", "chest", "barrel", "torch", "lantern", "glowstone",
        "sea_lantern", "iron_bars", "iron_block", "smooth_stone", "ladder", "bell",
    };
    c.suffixes = {
        "_planks", "_stairs", "_slab", "_fence", "_fence_gate", "_door", "_trapdoor",
        "_wall", "_bricks", "_stained_glass", "_stained_glass_pane", "_bed", "_carpet",
        "_pillar", "_concrete", "_terracotta",
    };
    return c;
}

BlockCatalog default_water_catalog() {
    BlockCatalog c;
    c.names = {"water", "bubble_column", "kelp", "kelp_plant", "seagrass", "tall_seagrass"};
    return c;
}

CatalogClassifier::CatalogClassifier(const IBlockStore& store,
                                     Dimension dimension,
                                     int32_t deep_water_depth)
    : CatalogClassifier(store,
                        std::move(dimension),
                        deep_water_depth,
                        default_vegetation_catalog(),
                        default_structure_catalog(),
                        default_water_catalog())
{}

CatalogClassifier::CatalogClassifier(const IBlockStore& store,
                                     Dimension dimension,
                                     int32_t deep_water_depth,
                                     BlockCatalog vegetation,
                                     BlockCatalog structure,
                                     BlockCatalog water)
    : store_(store)
    , dimension_(std::move(dimension))
    , deep_water_depth_(deep_water_depth)
    , vegetation_(std::move(vegetation))
    , structure_(std::move(structure))
    , water_(std::move(water))
{}

Classification CatalogClassifier::classify(const core::Coordinate& coord) const {
    const Material top = store_.get(coord, dimension_);
    if (is_structure(top)) {
        return Classification::Structure;
    }
    if (!is_water(top)) {
        return Classification::Open;
    }

    // Shallow water is wadeable; only a column of at least deep_water_depth
    // water blocks blocks passage.
    int32_t depth = 1;
    core::Coordinate probe = coord;
    while (depth < deep_water_depth_) {
        --probe.y;
        if (!is_water(store_.get(probe, dimension_))) {
            return Classification::Open;
        }
        ++depth;
    }
    return Classification::Water;
}

bool CatalogClassifier::is_vegetation(const Material& material) const {
    return vegetation_.matches(material.name);
}

bool CatalogClassifier::is_structure(const Material& material) const {
    return structure_.matches(material.name);
}

bool CatalogClassifier::is_water(const Material& material) const {
    return water_.matches(material.name);
}

} // namespace strata::world
