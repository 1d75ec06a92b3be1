#include <algorithm>
#include <cassert>
#include <functional>
#include <iostream>
#include <numeric>
#include <random>
#include <set>

#include "TestSupport.hpp"
#include "blast/core/Groups.hpp"

using namespace blast::core;
using blast::test::Checkerboard;
using blast::test::MakeBoard;

namespace {

constexpr int A = 0;
constexpr int B = 1;

// A A B
// A B B   (rows listed bottom to top)
// B B A
Board MakeScenarioBoard() {
    return MakeBoard(3, 3, 2, {A, A, B, A, B, B, B, B, A});
}

void TestGridStoreBounds() {
    Board board = MakeScenarioBoard();
    assert(board.inBounds(0, 0));
    assert(board.inBounds(2, 2));
    assert(!board.inBounds(-1, 0));
    assert(!board.inBounds(0, 3));
    assert(board.get(3, 0) == nullptr);
    assert(board.get(0, -1) == nullptr);
    assert(board.colorAt(5, 5) == kEmptyCell);

    const int before = board.occupiedCount();
    Tile stray;
    stray.id = 999;
    board.set(7, 7, stray);
    board.clear(-3, 1);
    assert(board.occupiedCount() == before);
}

void TestGridStoreAccess() {
    Board board = MakeScenarioBoard();
    assert(board.occupiedCount() == 9);

    const Tile* corner = board.get(2, 2);
    assert(corner != nullptr);
    assert(corner->color == A);
    assert(corner->col == 2 && corner->row == 2);
    assert(corner->state == TileState::Idle);
    assert(board.find(corner->id) == corner);

    std::vector<Cell> visited;
    board.forEach([&](const Tile& tile) { visited.push_back(tile.cell()); });
    assert(visited.size() == 9);
    assert(std::is_sorted(visited.begin(), visited.end()));

    const TileId id = board.get(0, 2)->id;
    board.clear(0, 2);
    assert(board.get(0, 2) == nullptr);
    assert(board.find(id) == nullptr);

    board.moveTile(Cell{1, 2}, Cell{0, 2});
    assert(board.get(1, 2) == nullptr);
    assert(board.get(0, 2)->col == 0);
    assert(board.get(0, 2)->row == 2);
    assert(board.allTiles().size() == 8);
}

void TestSpawnIdsAreUnique() {
    Board board(2, 2, 3, /*seed=*/3);
    std::set<TileId> ids;
    for (int col = 0; col < 2; ++col) {
        for (int row = 0; row < 2; ++row) {
            Tile* tile = board.spawn(col, row, board.randomColor());
            assert(tile != nullptr);
            assert(tile->state == TileState::Spawning);
            assert(tile->color >= 0 && tile->color < 3);
            ids.insert(tile->id);
        }
    }
    assert(ids.size() == 4);
    assert(ids.count(kInvalidTile) == 0);
    assert(board.spawn(2, 0, 0) == nullptr);
}

void TestFindGroupScenario() {
    Board board = MakeScenarioBoard();

    auto a_group = FindGroup(board, 0, 0, 2);
    assert(a_group.has_value());
    assert(a_group->color == A);
    std::set<Cell> a_cells(a_group->cells.begin(), a_group->cells.end());
    assert((a_cells == std::set<Cell>{{0, 0}, {1, 0}, {0, 1}}));

    auto b_group = FindGroup(board, 2, 0, 2);
    assert(b_group.has_value());
    assert(b_group->size() == 5);

    // Lone A in the top-right corner.
    assert(!FindGroup(board, 2, 2, 2).has_value());
    assert(!FindGroup(board, 3, 0, 2).has_value());
    assert(!FindGroup(board, 0, 0, 4).has_value());
}

void TestFindGroupSkipsBusyTiles() {
    Board board = MakeScenarioBoard();
    board.get(1, 0)->state = TileState::Falling;
    auto group = FindGroup(board, 0, 0, 2);
    assert(group.has_value());
    assert(group->size() == 2);

    board.get(0, 0)->state = TileState::Shuffling;
    assert(!FindGroup(board, 0, 0, 2).has_value());
}

bool Connected(const std::set<Cell>& cells) {
    if (cells.empty()) {
        return true;
    }
    std::set<Cell> reached{*cells.begin()};
    std::vector<Cell> stack{*cells.begin()};
    while (!stack.empty()) {
        Cell cell = stack.back();
        stack.pop_back();
        for (const auto& offset : kNeighborOffsets) {
            Cell next{cell.col + offset[0], cell.row + offset[1]};
            if (cells.count(next) > 0 && reached.insert(next).second) {
                stack.push_back(next);
            }
        }
    }
    return reached.size() == cells.size();
}

void TestFindGroupProperties() {
    std::mt19937 rng(2024);
    std::uniform_int_distribution<int> color_dist(0, 2);
    for (int trial = 0; trial < 50; ++trial) {
        std::vector<int> layout(25);
        for (auto& value : layout) {
            value = color_dist(rng);
        }
        Board board = MakeBoard(5, 5, 3, layout);
        for (int row = 0; row < 5; ++row) {
            for (int col = 0; col < 5; ++col) {
                auto group = FindGroup(board, col, row, 1);
                assert(group.has_value());
                std::set<Cell> cells(group->cells.begin(), group->cells.end());
                assert(cells.size() == group->cells.size());
                assert(cells.count(Cell{col, row}) == 1);
                assert(Connected(cells));
                for (const auto& cell : cells) {
                    assert(board.get(cell)->color == group->color);
                    for (const auto& offset : kNeighborOffsets) {
                        Cell next{cell.col + offset[0], cell.row + offset[1]};
                        const Tile* neighbor = board.get(next);
                        if (neighbor != nullptr && neighbor->color == group->color) {
                            assert(cells.count(next) == 1);
                        }
                    }
                }
            }
        }
    }
}

// Union-find component sizes, independent of the BFS under test.
int LargestComponent(const std::vector<int>& layout, int cols, int rows) {
    std::vector<int> parent(layout.size());
    std::iota(parent.begin(), parent.end(), 0);
    std::function<int(int)> root = [&](int i) {
        return parent[i] == i ? i : parent[i] = root(parent[i]);
    };
    for (int row = 0; row < rows; ++row) {
        for (int col = 0; col < cols; ++col) {
            int i = row * cols + col;
            if (col + 1 < cols && layout[i] == layout[i + 1]) {
                parent[root(i)] = root(i + 1);
            }
            if (row + 1 < rows && layout[i] == layout[i + cols]) {
                parent[root(i)] = root(i + cols);
            }
        }
    }
    std::vector<int> sizes(layout.size(), 0);
    int largest = 0;
    for (std::size_t i = 0; i < layout.size(); ++i) {
        largest = std::max(largest, ++sizes[static_cast<std::size_t>(root(static_cast<int>(i)))]);
    }
    return largest;
}

void TestDeadlockBruteForce() {
    std::mt19937 rng(99);
    std::uniform_int_distribution<int> color_dist(0, 2);
    for (int trial = 0; trial < 400; ++trial) {
        std::vector<int> layout(16);
        for (auto& value : layout) {
            value = color_dist(rng);
        }
        Board board = MakeBoard(4, 4, 3, layout);
        const int largest = LargestComponent(layout, 4, 4);
        for (int min_size = 2; min_size <= 3; ++min_size) {
            const bool expected = largest < min_size;
            assert(IsDeadlocked(board, min_size) == expected);
        }
    }
}

void TestDeadlockScenarios() {
    Board solid = MakeBoard(4, 4, 2, std::vector<int>(16, A));
    assert(!IsDeadlocked(solid, 2));

    Board checker = MakeBoard(4, 4, 2, Checkerboard(4, 4));
    assert(IsDeadlocked(checker, 2));

    Board empty = MakeBoard(2, 2, 2, {-1, -1, -1, -1});
    assert(empty.occupiedCount() == 0);
    assert(IsDeadlocked(empty, 2));
}

void TestRefreshGroupMetadata() {
    auto config = blast::test::MakeConfig(6, 2, 2);
    config.palette.thresholds = TierThresholds{2, 3, 4};
    // Bottom row: five A then B, top row all B.
    config.initial_layout = {A, A, A, A, A, B, B, B, B, B, B, B};
    Board board = NewBoard(config);
    RefreshGroupMetadata(board, config.palette);

    assert(board.get(0, 0)->group_size == 5);
    assert(board.get(0, 0)->icon == IconTier::Third);
    assert(board.get(4, 0)->icon == IconTier::Third);
    assert(board.get(5, 0)->group_size == 7);
    assert(board.get(0, 1)->icon == IconTier::Third);

    config.initial_layout = {A, B, A, B, A, B, B, A, A, A, B, A};
    Board mixed = NewBoard(config);
    RefreshGroupMetadata(mixed, config.palette);
    assert(mixed.get(0, 0)->group_size == 1);
    assert(mixed.get(0, 0)->icon == IconTier::Default);
    // A at (2,0),(1,1),(2,1),(3,1) forms four tiles.
    assert(mixed.get(2, 0)->group_size == 4);
    assert(mixed.get(3, 1)->icon == IconTier::Second);
    // B at (3,0) alone below an A.
    assert(mixed.get(3, 0)->group_size == 1);
}

void TestPaletteTiers() {
    Palette palette;
    assert(palette.TierFor(1) == IconTier::Default);
    assert(palette.TierFor(4) == IconTier::Default);
    assert(palette.TierFor(5) == IconTier::First);
    assert(palette.TierFor(7) == IconTier::First);
    assert(palette.TierFor(8) == IconTier::Second);
    assert(palette.TierFor(10) == IconTier::Third);
}

}  // namespace

void TestNewBoardSkipsUnknownColors() {
    Board board = MakeBoard(2, 2, 2, {A, -2, 5, B});
    assert(board.occupiedCount() == 2);
    assert(board.get(1, 0) == nullptr);
    assert(board.get(0, 1) == nullptr);
    assert(board.colorAt(0, 0) == A);
    assert(board.colorAt(1, 1) == B);
    assert(board.get(0, 0)->state == TileState::Idle);
}

int main() {
    TestGridStoreBounds();
    TestGridStoreAccess();
    TestSpawnIdsAreUnique();
    TestNewBoardSkipsUnknownColors();
    TestFindGroupScenario();
    TestFindGroupSkipsBusyTiles();
    TestFindGroupProperties();
    TestDeadlockBruteForce();
    TestDeadlockScenarios();
    TestRefreshGroupMetadata();
    TestPaletteTiers();
    std::cout << "All board tests passed.\n";
    return 0;
}
