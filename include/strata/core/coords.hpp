#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <tuple>

namespace strata::core {

struct Coordinate {
    int32_t x = 0;
    int32_t y = 0;
    int32_t z = 0;
};

struct Coordinate2D {
    int32_t x = 0;
    int32_t z = 0;
};

struct ChunkCoord {
    int32_t x = 0;
    int32_t y = 0;
    int32_t z = 0;
};

struct LocalVoxelCoord {
    uint16_t x = 0;
    uint16_t y = 0;
    uint16_t z = 0;
};

struct WorldConfig {
    int32_t chunk_size = 16;
    int32_t min_y = -64;
    int32_t max_y = 319;
    int32_t sea_level = 62;
};

inline bool operator==(const Coordinate& a, const Coordinate& b) noexcept {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}
inline bool operator!=(const Coordinate& a, const Coordinate& b) noexcept { return !(a == b); }
inline bool operator<(const Coordinate& a, const Coordinate& b) noexcept {
    return std::tie(a.x, a.y, a.z) < std::tie(b.x, b.y, b.z);
}

inline bool operator==(const Coordinate2D& a, const Coordinate2D& b) noexcept {
    return a.x == b.x && a.z == b.z;
}
inline bool operator!=(const Coordinate2D& a, const Coordinate2D& b) noexcept { return !(a == b); }
inline bool operator<(const Coordinate2D& a, const Coordinate2D& b) noexcept {
    return std::tie(a.x, a.z) < std::tie(b.x, b.z);
}

inline bool operator==(const ChunkCoord& a, const ChunkCoord& b) noexcept {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

struct CoordinateHash {
    std::size_t operator()(const Coordinate& c) const noexcept {
        std::size_t h1 = std::hash<int32_t>{}(c.x);
        std::size_t h2 = std::hash<int32_t>{}(c.y);
        std::size_t h3 = std::hash<int32_t>{}(c.z);
        return h1 ^ (h2 << 1) ^ (h3 << 2);
    }
};

struct Coordinate2DHash {
    std::size_t operator()(const Coordinate2D& c) const noexcept {
        return (static_cast<std::size_t>(static_cast<uint32_t>(c.x)) << 32)
             ^ static_cast<std::size_t>(static_cast<uint32_t>(c.z));
    }
};

inline Coordinate2D column_of(const Coordinate& c) noexcept {
    return {c.x, c.z};
}

// Inclusive axis-aligned rectangle in the horizontal plane.
// Empty when max < min on either axis.
struct Rect {
    int32_t min_x = 0;
    int32_t min_z = 0;
    int32_t max_x = -1;
    int32_t max_z = -1;

    static Rect around(const Coordinate2D& center, int32_t radius) noexcept {
        return {center.x - radius, center.z - radius, center.x + radius, center.z + radius};
    }

    static Rect spanning(const Coordinate2D& a, const Coordinate2D& b) noexcept {
        return {
            a.x < b.x ? a.x : b.x,
            a.z < b.z ? a.z : b.z,
            a.x < b.x ? b.x : a.x,
            a.z < b.z ? b.z : a.z,
        };
    }

    [[nodiscard]] bool empty() const noexcept { return max_x < min_x || max_z < min_z; }
    [[nodiscard]] int32_t width() const noexcept { return empty() ? 0 : max_x - min_x + 1; }
    [[nodiscard]] int32_t depth() const noexcept { return empty() ? 0 : max_z - min_z + 1; }
    [[nodiscard]] std::size_t area() const noexcept {
        return static_cast<std::size_t>(width()) * static_cast<std::size_t>(depth());
    }

    [[nodiscard]] bool contains(const Coordinate2D& c) const noexcept {
        return c.x >= min_x && c.x <= max_x && c.z >= min_z && c.z <= max_z;
    }

    [[nodiscard]] bool contains(const Rect& other) const noexcept {
        return other.empty() ||
               (other.min_x >= min_x && other.max_x <= max_x &&
                other.min_z >= min_z && other.max_z <= max_z);
    }

    [[nodiscard]] Rect expanded(int32_t by) const noexcept {
        return {min_x - by, min_z - by, max_x + by, max_z + by};
    }

    // z is the slow axis: idx = (z - min_z) * width + (x - min_x)
    [[nodiscard]] std::size_t index(const Coordinate2D& c) const noexcept {
        return static_cast<std::size_t>(c.z - min_z) * static_cast<std::size_t>(width()) +
               static_cast<std::size_t>(c.x - min_x);
    }

    [[nodiscard]] Coordinate2D at_index(std::size_t idx) const noexcept {
        const auto w = static_cast<std::size_t>(width());
        return {min_x + static_cast<int32_t>(idx % w), min_z + static_cast<int32_t>(idx / w)};
    }
};

inline bool operator==(const Rect& a, const Rect& b) noexcept {
    if (a.empty() && b.empty()) {
        return true;
    }
    return a.min_x == b.min_x && a.min_z == b.min_z && a.max_x == b.max_x && a.max_z == b.max_z;
}
inline bool operator!=(const Rect& a, const Rect& b) noexcept { return !(a == b); }

// Euclidean distance from a column to the nearest column of a rectangle;
// zero inside.
inline double distance_to_rect(const Coordinate2D& c, const Rect& r) noexcept {
    const int32_t dx = c.x < r.min_x ? r.min_x - c.x : (c.x > r.max_x ? c.x - r.max_x : 0);
    const int32_t dz = c.z < r.min_z ? r.min_z - c.z : (c.z > r.max_z ? c.z - r.max_z : 0);
    return std::sqrt(static_cast<double>(dx) * dx + static_cast<double>(dz) * dz);
}

} // namespace strata::core
