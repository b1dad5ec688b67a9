#pragma once

#include "strata/world/block_store.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace strata::world {

enum class Classification : uint8_t {
    Open,
    Structure,
    Water,
    Steep,
};

const char* to_string(Classification c) noexcept;

// Injected block-catalog knowledge used by scanning and obstacle building.
class IBlockClassifier {
public:
    virtual ~IBlockClassifier() = default;

    // Classifies the column whose top block sits at `coord`.
    virtual Classification classify(const core::Coordinate& coord) const = 0;
    virtual bool is_vegetation(const Material& material) const = 0;
};

// Name sets plus suffix rules; a name matches a catalog if it is listed
// exactly or ends with one of the catalog's suffixes.
struct BlockCatalog {
    std::set<std::string> names;
    std::vector<std::string> suffixes;

    [[nodiscard]] bool matches(const std::string& name) const;
};

BlockCatalog default_vegetation_catalog();
BlockCatalog default_structure_catalog();
BlockCatalog default_water_catalog();

// Classifies by looking blocks up in the store.
class CatalogClassifier final : public IBlockClassifier {
public:
    explicit CatalogClassifier(const IBlockStore& store,
                               Dimension dimension = kOverworld,
                               int32_t deep_water_depth = 2);

    CatalogClassifier(const IBlockStore& store,
                      Dimension dimension,
                      int32_t deep_water_depth,
                      BlockCatalog vegetation,
                      BlockCatalog structure,
                      BlockCatalog water);

    Classification classify(const core::Coordinate& coord) const override;
    bool is_vegetation(const Material& material) const override;

    [[nodiscard]] bool is_structure(const Material& material) const;
    [[nodiscard]] bool is_water(const Material& material) const;

private:
    const IBlockStore& store_;
    Dimension dimension_;
    int32_t deep_water_depth_;
    BlockCatalog vegetation_;
    BlockCatalog structure_;
    BlockCatalog water_;
};

} // namespace strata::world
