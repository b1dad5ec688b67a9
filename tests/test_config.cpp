/**
 * @file test_config.cpp
 * @brief Engine configuration overlay and name resolution
 */

#include <gtest/gtest.h>

#include "strata/core/errors.hpp"
#include "strata/io/config_file.hpp"
#include "strata/world/name_resolver.hpp"

#include <map>
#include <stdexcept>
#include <string>

using namespace strata;

// =============================================================================
// Engine config
// =============================================================================

TEST(EngineConfigTest, EmptyDocumentKeepsDefaults) {
    const EngineConfig cfg = io::engine_config_from_yaml("");
    const EngineConfig defaults;

    EXPECT_EQ(defaults.verbose, cfg.verbose);
    EXPECT_EQ(defaults.scan.probe_top, cfg.scan.probe_top);
    EXPECT_EQ(defaults.obstacles.max_step, cfg.obstacles.max_step);
    EXPECT_DOUBLE_EQ(defaults.path.elevation_penalty, cfg.path.elevation_penalty);
    EXPECT_EQ("dirt", cfg.flatten.fill.name);
    EXPECT_FALSE(cfg.flatten.surface.has_value());
}

TEST(EngineConfigTest, OverlaysGivenKeys) {
    const EngineConfig cfg = io::engine_config_from_yaml(
        "verbose: false\n"
        "scan: {dimension: 'minecraft:the_nether', probe_top: 120, probe_bottom: 0}\n"
        "obstacles: {max_step: 2}\n"
        "path: {elevation_penalty: 4.5, clearance: 0, margin: 8}\n"
        "flatten: {fill: sand, surface: 'grass_block[snowy=false]'}\n"
        "place: {flush_interval: 4096}\n"
        "unknown_section: {whatever: 1}\n");

    EXPECT_FALSE(cfg.verbose);
    EXPECT_EQ("minecraft:the_nether", cfg.scan.dimension);
    EXPECT_EQ(120, cfg.scan.probe_top);
    EXPECT_EQ(0, cfg.scan.probe_bottom);
    EXPECT_EQ(2, cfg.obstacles.max_step);
    EXPECT_DOUBLE_EQ(4.5, cfg.path.elevation_penalty);
    EXPECT_EQ(0, cfg.path.clearance);
    EXPECT_EQ(8, cfg.path_margin);
    EXPECT_EQ("sand", cfg.flatten.fill.name);
    ASSERT_TRUE(cfg.flatten.surface.has_value());
    EXPECT_EQ("false", cfg.flatten.surface->properties.at("snowy"));
    EXPECT_EQ(4096u, cfg.place_flush_interval);
}

TEST(EngineConfigTest, WrongTypesAreRejected) {
    EXPECT_THROW(io::engine_config_from_yaml("obstacles: {max_step: steep}\n"), std::invalid_argument);
    EXPECT_THROW(io::engine_config_from_yaml("path: 3\n"), std::invalid_argument);
    EXPECT_THROW(io::engine_config_from_yaml("verbose: [1, 2]\n"), std::invalid_argument);
    EXPECT_THROW(io::engine_config_from_yaml("flatten: {fill: 'door[open'}\n"), std::invalid_argument);
    EXPECT_THROW(io::engine_config_from_yaml("scan: {probe_top: 0, probe_bottom: 10}\n"), std::invalid_argument);
}

TEST(EngineConfigTest, MissingFileIsLoadError) {
    EXPECT_THROW(io::load_engine_config("/nonexistent/strata.yaml"), core::LoadError);
}

// =============================================================================
// Name resolution
// =============================================================================

TEST(NameResolverTest, CorrectsKnownTypos) {
    const world::AliasNameResolver resolver;

    EXPECT_EQ("glass_pane", resolver.correct("glass_panel"));
    EXPECT_EQ("oak_planks", resolver.correct("Planks"));
    EXPECT_EQ("cobblestone", resolver.correct("  minecraft:cobble "));
    EXPECT_EQ("short_grass", resolver.correct("grass"));
}

TEST(NameResolverTest, UnknownNamesPassThroughUnchanged) {
    const world::AliasNameResolver resolver;

    EXPECT_EQ("stone", resolver.correct("stone"));
    EXPECT_EQ("minecraft:Diamond_Block", resolver.correct("minecraft:Diamond_Block"));
}

TEST(NameResolverTest, CustomAliasesAndMaterials) {
    world::AliasNameResolver resolver(std::map<std::string, std::string>{});
    resolver.add_alias("Red Wool", "red_wool");

    EXPECT_EQ(1u, resolver.aliases().size());
    EXPECT_EQ("red_wool", resolver.correct("red wool"));
    EXPECT_EQ("glass_panel", resolver.correct("glass_panel"));

    const world::Material m = world::resolve(resolver, world::Material{"RED WOOL", {{"a", "b"}}});
    EXPECT_EQ("red_wool", m.name);
    EXPECT_EQ("b", m.properties.at("a"));
}
