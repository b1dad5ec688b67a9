#include "strata/nav/path_planner.hpp"

#include "strata/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <queue>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace strata::nav {

namespace {

constexpr double kDiagonalCost = 1.4142135623730951;

struct OpenNode {
    double f;
    uint64_t seq;
    std::size_t idx;
};

// Min-heap on f; earlier sequence number wins ties.
struct OpenCmp {
    bool operator()(const OpenNode& a, const OpenNode& b) const noexcept {
        if (a.f != b.f) {
            return a.f > b.f;
        }
        return a.seq > b.seq;
    }
};

constexpr int kDx[8] = {1, -1, 0, 0, 1, 1, -1, -1};
constexpr int kDz[8] = {0, 0, 1, -1, 1, -1, 1, -1};

inline int sign(int32_t v) noexcept {
    return (v > 0) - (v < 0);
}

inline double euclidean(const core::Coordinate2D& a, const core::Coordinate2D& b) noexcept {
    const double dx = static_cast<double>(a.x) - b.x;
    const double dz = static_cast<double>(a.z) - b.z;
    return std::sqrt(dx * dx + dz * dz);
}

std::string describe(const char* what, const core::Coordinate2D& c) {
    return std::string(what) + " (" + std::to_string(c.x) + ", " + std::to_string(c.z) + ")";
}

} // namespace

double horizontal_length(const std::vector<core::Coordinate>& points) noexcept {
    double total = 0.0;
    for (std::size_t i = 1; i < points.size(); ++i) {
        const bool diagonal = points[i].x != points[i - 1].x && points[i].z != points[i - 1].z;
        total += diagonal ? kDiagonalCost : 1.0;
    }
    return total;
}

Path plan_path(const core::Coordinate2D& start,
               const core::Coordinate2D& goal,
               const ObstacleGrid& grid,
               const terrain::HeightMap& map,
               int32_t width,
               const PathConfig& cfg)
{
    if (width < 1) {
        throw std::invalid_argument("path width must be at least 1");
    }
    if (map.rect() != grid.rect() || map.empty() != grid.empty()) {
        throw std::invalid_argument("height map and obstacle grid must cover the same rectangle");
    }
    if (!grid.contains(start)) {
        throw core::OutOfBounds(describe("start", start) + " is outside the obstacle grid");
    }
    if (!grid.contains(goal)) {
        throw core::OutOfBounds(describe("goal", goal) + " is outside the obstacle grid");
    }
    if (!grid.passable(goal)) {
        throw core::NoPathFound(describe("goal", goal) + " is impassable");
    }

    const core::Rect& rect = grid.rect();
    const std::size_t n = rect.area();
    const std::vector<int32_t>& heights = map.heights();
    constexpr double kInf = std::numeric_limits<double>::infinity();
    constexpr std::size_t kNone = std::numeric_limits<std::size_t>::max();

    std::vector<double>       g_cost(n, kInf);
    std::vector<std::size_t>  parent(n, kNone);
    std::vector<std::uint8_t> closed(n, 0);

    const std::size_t s_idx = rect.index(start);
    const std::size_t t_idx = rect.index(goal);

    // Priority queue without decrease-key: a better entry is pushed again and
    // the stale one is skipped once the node is closed.
    std::priority_queue<OpenNode, std::vector<OpenNode>, OpenCmp> open;
    uint64_t seq = 0;

    g_cost[s_idx] = 0.0;
    open.push({euclidean(start, goal), seq++, s_idx});

    std::size_t expanded = 0;

    while (!open.empty()) {
        const OpenNode top = open.top();
        open.pop();

        if (closed[top.idx]) {
            continue;
        }

        if (top.idx == t_idx) {
            std::vector<core::Coordinate> rev;
            for (std::size_t p = top.idx; p != kNone; p = parent[p]) {
                const core::Coordinate2D c = rect.at_index(p);
                rev.push_back({c.x, heights[p] + cfg.clearance, c.z});
            }

            Path path;
            path.centerline.assign(rev.rbegin(), rev.rend());
            path.cost = g_cost[t_idx];
            path.expanded = expanded;
            path.cells = widen(path.centerline, rect, width);
            return path;
        }

        closed[top.idx] = 1;
        ++expanded;

        const core::Coordinate2D p = rect.at_index(top.idx);
        for (int i = 0; i < 8; ++i) {
            const core::Coordinate2D next{p.x + kDx[i], p.z + kDz[i]};
            if (!rect.contains(next)) {
                continue;
            }
            const std::size_t n_idx = rect.index(next);
            if (closed[n_idx] || !grid.passable_at(n_idx)) {
                continue;
            }

            const bool diagonal = kDx[i] != 0 && kDz[i] != 0;
            if (diagonal) {
                const std::size_t side_x = rect.index({next.x, p.z});
                const std::size_t side_z = rect.index({p.x, next.z});
                if (!grid.passable_at(side_x) || !grid.passable_at(side_z)) {
                    continue;
                }
            }

            const double climb = std::abs(heights[n_idx] - heights[top.idx]);
            const double step = (diagonal ? kDiagonalCost : 1.0) + cfg.elevation_penalty * climb;
            const double tentative = g_cost[top.idx] + step;

            if (tentative < g_cost[n_idx]) {
                g_cost[n_idx] = tentative;
                parent[n_idx] = top.idx;
                open.push({tentative + euclidean(next, goal), seq++, n_idx});
            }
        }
    }

    throw core::NoPathFound("no route from " + describe("start", start) + " to " +
                            describe("goal", goal) + " after expanding " +
                            std::to_string(expanded) + " cell(s)");
}

std::vector<core::Coordinate> widen(const std::vector<core::Coordinate>& centerline,
                                    const core::Rect& domain,
                                    int32_t width)
{
    if (width < 1) {
        throw std::invalid_argument("path width must be at least 1");
    }

    const int32_t half = (width - 1) / 2;
    std::vector<core::Coordinate> cells;
    cells.reserve(centerline.size() * static_cast<std::size_t>(1 + 2 * half));
    std::unordered_set<core::Coordinate2D, core::Coordinate2DHash> seen;

    auto add = [&](const core::Coordinate& c) {
        if (domain.contains(core::column_of(c)) && seen.insert(core::column_of(c)).second) {
            cells.push_back(c);
        }
    };

    for (std::size_t i = 0; i < centerline.size(); ++i) {
        const core::Coordinate& center = centerline[i];
        add(center);
        if (half == 0) {
            continue;
        }

        const core::Coordinate& prev = i > 0 ? centerline[i - 1] : center;
        const core::Coordinate& next = i + 1 < centerline.size() ? centerline[i + 1] : center;
        const int dx = sign(next.x - prev.x);
        const int dz = sign(next.z - prev.z);

        // Perpendicular to the local direction; a lone point widens along x.
        int px = -dz;
        int pz = dx;
        if (px == 0 && pz == 0) {
            px = 1;
        }
        const bool diagonal = px != 0 && pz != 0;

        for (int32_t k = 1; k <= half; ++k) {
            add({center.x + px * k, center.y, center.z + pz * k});
            add({center.x - px * k, center.y, center.z - pz * k});
            if (diagonal) {
                // Orthogonal in-between cells keep a diagonal road 4-connected.
                add({center.x + px * k, center.y, center.z + pz * (k - 1)});
                add({center.x + px * (k - 1), center.y, center.z + pz * k});
                add({center.x - px * k, center.y, center.z - pz * (k - 1)});
                add({center.x - px * (k - 1), center.y, center.z - pz * k});
            }
        }
    }

    return cells;
}

} // namespace strata::nav
