#pragma once

#include "strata/core/coords.hpp"
#include "strata/world/block_classifier.hpp"
#include "strata/world/block_store.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace strata::terrain {

enum class ScanMode : uint8_t {
    Surface, // first non-air block from the top
    Ground,  // first block that is neither air nor vegetation
};

const char* to_string(ScanMode mode) noexcept;

struct ScanConfig {
    world::Dimension dimension = world::kOverworld;
    int32_t probe_top = 319;
    int32_t probe_bottom = -64;
};

// Immutable per-column elevation snapshot over exactly one rectangle.
// Columns where the probe found nothing hold probe_bottom - 1.
class HeightMap {
public:
    HeightMap() = default;
    HeightMap(core::Rect rect, ScanMode mode, std::vector<int32_t> heights);

    [[nodiscard]] const core::Rect& rect() const noexcept { return rect_; }
    [[nodiscard]] ScanMode mode() const noexcept { return mode_; }
    [[nodiscard]] bool empty() const noexcept { return heights_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return heights_.size(); }
    [[nodiscard]] bool contains(const core::Coordinate2D& column) const noexcept {
        return !empty() && rect_.contains(column);
    }

    // Throws core::OutOfBounds outside the map's rectangle.
    [[nodiscard]] int32_t at(const core::Coordinate2D& column) const;
    [[nodiscard]] std::optional<int32_t> find(const core::Coordinate2D& column) const noexcept;

    [[nodiscard]] const std::vector<int32_t>& heights() const noexcept { return heights_; }

    template <typename Func>
    void for_each(Func&& f) const
    {
        for (std::size_t i = 0; i < heights_.size(); ++i) {
            f(rect_.at_index(i), heights_[i]);
        }
    }

private:
    core::Rect rect_{};
    ScanMode mode_ = ScanMode::Surface;
    std::vector<int32_t> heights_;
};

struct HeightBounds {
    int32_t min_x = 0;
    int32_t max_x = 0;
    int32_t min_z = 0;
    int32_t max_z = 0;
    int32_t min_y = 0;
    int32_t max_y = 0;
};

// Derived purely from the map's columns and elevations; nullopt when empty.
std::optional<HeightBounds> bounds(const HeightMap& map);

// Samples the square center ± radius. A negative radius yields an empty map.
// LoadError from the store propagates.
HeightMap scan_height_map(const world::IBlockStore& store,
                          const world::IBlockClassifier& classifier,
                          const core::Coordinate2D& center,
                          int32_t radius,
                          ScanMode mode,
                          const ScanConfig& cfg = {});

// Same as above over an arbitrary rectangle.
HeightMap scan_height_map(const world::IBlockStore& store,
                          const world::IBlockClassifier& classifier,
                          const core::Rect& rect,
                          ScanMode mode,
                          const ScanConfig& cfg = {});

} // namespace strata::terrain
