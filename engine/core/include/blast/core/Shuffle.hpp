#pragma once

#include <optional>
#include <random>
#include <unordered_set>
#include <utility>
#include <vector>

#include "blast/core/Events.hpp"
#include "blast/core/Groups.hpp"
#include "blast/core/Lifecycle.hpp"

namespace blast::core {

inline constexpr int kMaxGuaranteedClusterSize = 5;
inline constexpr int kClusterSearchAttempts = 20;

using CellSet = std::unordered_set<Cell, CellHash>;

// In-place Fisher-Yates: for i from the last index down to 1, swap element i
// with a uniformly chosen element at index <= i.
template <typename T>
void FisherYates(std::vector<T>& items, std::mt19937& rng) {
    for (std::size_t i = items.size(); i > 1; --i) {
        std::uniform_int_distribution<std::size_t> dist(0, i - 1);
        std::swap(items[i - 1], items[dist(rng)]);
    }
}

// Randomized BFS for up to `count` mutually adjacent occupied cells outside
// `reserved`. Gives up after kClusterSearchAttempts starts and returns an empty
// vector; a shorter cluster is accepted once it reaches min_size.
std::vector<Cell> FindRandomCluster(Board& board, int count, int min_size, const CellSet& reserved);

// Repositions every tile so that up to N colors get a ready-made group.
// Plan() only reads the board, Commit() moves the tiles, Finalize() runs once
// the tiles have settled back to Idle.
class ShuffleResolver {
public:
    ShuffleResolver(Board& board, TileLifecycle& lifecycle, const Palette& palette)
        : board_(board), lifecycle_(lifecycle), palette_(palette) {}

    ShuffleResult Plan(int guaranteed_color_count);
    void Commit(const ShuffleResult& plan);
    void Finalize(ShuffleResult& result);

    // Forces one group of min_group_size into existence by recoloring the
    // tiles next to the first horizontally adjacent pair. Returns the cells
    // whose color changed.
    std::vector<Cell> ApplyEmergencyFix();

private:
    std::optional<std::pair<Cell, Cell>> FirstAdjacentPair() const;

    Board& board_;
    TileLifecycle& lifecycle_;
    const Palette& palette_;
};

}  // namespace blast::core
