#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace blast::core {

// Row 0 is the bottom row; gravity pulls tiles toward lower rows.
struct Cell {
    std::int32_t col{};
    std::int32_t row{};

    constexpr bool operator==(const Cell& other) const noexcept {
        return col == other.col && row == other.row;
    }

    constexpr bool operator!=(const Cell& other) const noexcept {
        return !(*this == other);
    }

    // Row-major: bottom row first, left to right within a row.
    constexpr bool operator<(const Cell& other) const noexcept {
        return row < other.row || (row == other.row && col < other.col);
    }
};

using TileId = std::uint32_t;

inline constexpr TileId kInvalidTile = 0;

struct CellHash {
    std::size_t operator()(const Cell& cell) const noexcept {
        auto key = static_cast<std::uint64_t>(
            (static_cast<std::uint64_t>(static_cast<std::uint32_t>(cell.col)) << 32) |
            static_cast<std::uint32_t>(cell.row));
        return std::hash<std::uint64_t>{}(key);
    }
};

// Up, down, left, right. No diagonals.
inline constexpr int kNeighborOffsets[4][2] = {{0, 1}, {0, -1}, {-1, 0}, {1, 0}};

}  // namespace blast::core
