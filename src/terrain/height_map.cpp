#include "strata/terrain/height_map.hpp"

#include "strata/core/errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace strata::terrain {

namespace {

int32_t probe_column(const world::IBlockStore& store,
                     const world::IBlockClassifier& classifier,
                     const core::Coordinate2D& column,
                     ScanMode mode,
                     const ScanConfig& cfg)
{
    for (int32_t y = cfg.probe_top; y >= cfg.probe_bottom; --y) {
        const world::Material m = store.get({column.x, y, column.z}, cfg.dimension);
        if (m.is_air()) {
            continue;
        }
        if (mode == ScanMode::Ground && classifier.is_vegetation(m)) {
            continue;
        }
        return y;
    }
    return cfg.probe_bottom - 1;
}

} // namespace

const char* to_string(ScanMode mode) noexcept {
    switch (mode) {
    case ScanMode::Surface: return "surface";
    case ScanMode::Ground:  return "ground";
    }
    return "unknown";
}

HeightMap::HeightMap(core::Rect rect, ScanMode mode, std::vector<int32_t> heights)
    : rect_(rect)
    , mode_(mode)
    , heights_(std::move(heights))
{
    if (heights_.size() != rect_.area()) {
        throw std::invalid_argument("height count must match the rectangle's area");
    }
}

int32_t HeightMap::at(const core::Coordinate2D& column) const {
    if (!contains(column)) {
        throw core::OutOfBounds("column (" + std::to_string(column.x) + ", " +
                                std::to_string(column.z) + ") is outside the height map");
    }
    return heights_[rect_.index(column)];
}

std::optional<int32_t> HeightMap::find(const core::Coordinate2D& column) const noexcept {
    if (!contains(column)) {
        return std::nullopt;
    }
    return heights_[rect_.index(column)];
}

std::optional<HeightBounds> bounds(const HeightMap& map) {
    if (map.empty()) {
        return std::nullopt;
    }
    const auto [lo, hi] = std::minmax_element(map.heights().begin(), map.heights().end());
    const core::Rect& r = map.rect();
    return HeightBounds{r.min_x, r.max_x, r.min_z, r.max_z, *lo, *hi};
}

HeightMap scan_height_map(const world::IBlockStore& store,
                          const world::IBlockClassifier& classifier,
                          const core::Coordinate2D& center,
                          int32_t radius,
                          ScanMode mode,
                          const ScanConfig& cfg)
{
    return scan_height_map(store, classifier, core::Rect::around(center, radius), mode, cfg);
}

HeightMap scan_height_map(const world::IBlockStore& store,
                          const world::IBlockClassifier& classifier,
                          const core::Rect& rect,
                          ScanMode mode,
                          const ScanConfig& cfg)
{
    if (cfg.probe_top < cfg.probe_bottom) {
        throw std::invalid_argument("probe_top must not be below probe_bottom");
    }
    if (rect.empty()) {
        return HeightMap{core::Rect{}, mode, {}};
    }

    std::vector<int32_t> heights(rect.area());
    for (std::size_t i = 0; i < heights.size(); ++i) {
        heights[i] = probe_column(store, classifier, rect.at_index(i), mode, cfg);
    }
    return HeightMap{rect, mode, std::move(heights)};
}

} // namespace strata::terrain
