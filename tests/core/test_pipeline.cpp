#include <cassert>
#include <cstdint>
#include <iostream>
#include <vector>

#include "TestSupport.hpp"
#include "blast/core/Pipeline.hpp"

using namespace blast::core;
using blast::test::Checkerboard;
using blast::test::MakeConfig;
using blast::test::RunToIdle;

namespace {

std::vector<PipelineEventType> PhaseMessages(const std::vector<PipelineEvent>& events) {
    std::vector<PipelineEventType> types;
    for (const auto& event : events) {
        if (event.type != PipelineEventType::TileStateChanged) {
            types.push_back(event.type);
        }
    }
    return types;
}

int CountStateChanges(const std::vector<PipelineEvent>& events, TileState to) {
    int count = 0;
    for (const auto& event : events) {
        if (event.type == PipelineEventType::TileStateChanged && event.new_state == to) {
            ++count;
        }
    }
    return count;
}

void CheckSettledBoard(const Pipeline& pipeline) {
    const Board& board = pipeline.board();
    assert(board.occupiedCount() == board.cols() * board.rows());
    board.forEach([&](const Tile& tile) {
        assert(tile.state == TileState::Idle);
        assert(board.get(tile.col, tile.row) == &tile);
        auto group = FindGroup(board, tile.col, tile.row, pipeline.config().palette.min_group_size);
        const int expected = group ? group->size() : 1;
        assert(tile.group_size == expected);
        assert(tile.icon == pipeline.config().palette.TierFor(expected) || !group);
    });
}

GameConfig ScenarioConfig() {
    auto config = MakeConfig(3, 3, 2);
    config.initial_layout = {0, 0, 1, 0, 1, 1, 1, 1, 0};
    return config;
}

void TestStartOnPlayableBoard() {
    Pipeline pipeline(ScenarioConfig());
    pipeline.Start();
    assert(pipeline.phase() == PipelinePhase::Idle);
    assert(pipeline.CanProcessInput());
    auto events = pipeline.DrainEvents();
    assert(events.size() == 1);
    assert(events[0].type == PipelineEventType::Ready);
    assert(pipeline.board().get(0, 0)->group_size == 3);
    assert(pipeline.board().get(2, 2)->group_size == 1);
    assert(pipeline.DrainEvents().empty());
}

void TestBlastCycleHoldsTheLock() {
    Pipeline pipeline(ScenarioConfig());
    pipeline.Start();
    pipeline.DrainEvents();

    auto a_group = pipeline.EvaluateMove(0, 0);
    auto b_group = pipeline.EvaluateMove(2, 0);
    assert(a_group && b_group);
    assert(!pipeline.EvaluateMove(2, 2));

    assert(pipeline.RequestBlast(*a_group) == BlastStatus::Started);
    assert(pipeline.phase() == PipelinePhase::Blasting);
    assert(!pipeline.CanProcessInput());
    assert(pipeline.RequestBlast(*b_group) == BlastStatus::Busy);
    assert(!pipeline.RequestShuffle());

    auto blasting = pipeline.DrainEvents();
    assert(CountStateChanges(blasting, TileState::Blasting) == 3);
    assert(PhaseMessages(blasting).empty());

    // Blasting tiles never settle; the removal signal is CompleteBlast().
    const TileId doomed = pipeline.board().get(0, 0)->id;
    assert(!pipeline.SettleTile(doomed));
    pipeline.Update();
    assert(pipeline.phase() == PipelinePhase::Blasting);

    assert(pipeline.CompleteBlast());
    assert(!pipeline.CompleteBlast());
    assert(pipeline.phase() == PipelinePhase::Falling);
    assert(pipeline.board().find(doomed) == nullptr);
    assert(pipeline.RequestBlast(*b_group) == BlastStatus::Busy);

    auto falling = pipeline.DrainEvents();
    auto messages = PhaseMessages(falling);
    assert(messages.size() == 2);
    assert(messages[0] == PipelineEventType::BlastComplete);
    assert(messages[1] == PipelineEventType::GravityComplete);
    for (const auto& event : falling) {
        if (event.type == PipelineEventType::BlastComplete) {
            assert(event.removed.size() == 3);
        }
        if (event.type == PipelineEventType::GravityComplete) {
            assert(event.gravity.spawned.size() == 3);
            // Column 0 loses two tiles, column 1 loses one.
            assert(event.gravity.fell.size() == 3);
            assert((event.gravity.fell[0].from == Cell{0, 2}));
            assert((event.gravity.fell[0].to == Cell{0, 0}));
        }
    }

    // Nothing advances until every moved tile has settled.
    pipeline.Update();
    assert(pipeline.phase() == PipelinePhase::Falling);

    RunToIdle(pipeline);
    assert(pipeline.phase() == PipelinePhase::Idle);
    auto rest = PhaseMessages(pipeline.DrainEvents());
    assert(!rest.empty());
    assert(rest.back() == PipelineEventType::Ready);
    CheckSettledBoard(pipeline);
    assert(!IsDeadlocked(pipeline.board(), 2));
}

void TestInvalidRequestsChangeNothing() {
    Pipeline pipeline(ScenarioConfig());
    pipeline.Start();
    pipeline.DrainEvents();

    assert(pipeline.RequestBlast(Group{}) == BlastStatus::InvalidGroup);
    Group lone{0, {Cell{2, 2}}};
    assert(pipeline.RequestBlast(lone) == BlastStatus::InvalidGroup);
    Group wrong_color{1, {Cell{0, 0}, Cell{1, 0}}};
    assert(pipeline.RequestBlast(wrong_color) == BlastStatus::InvalidGroup);
    // Two A tiles that do not touch.
    Group scattered{0, {Cell{0, 0}, Cell{2, 2}}};
    assert(pipeline.RequestBlast(scattered) == BlastStatus::InvalidGroup);
    // Two cells of the five-tile B group.
    Group partial{1, {Cell{2, 0}, Cell{2, 1}}};
    assert(pipeline.RequestBlast(partial) == BlastStatus::InvalidGroup);

    assert(pipeline.phase() == PipelinePhase::Idle);
    assert(!pipeline.CompleteBlast());
    assert(pipeline.DrainEvents().empty());
    assert(pipeline.board().occupiedCount() == 9);
}

void TestDeadlockedStartShuffles() {
    auto config = MakeConfig(4, 4, 2);
    config.initial_layout = Checkerboard(4, 4);
    Pipeline pipeline(config);
    pipeline.Start();

    assert(pipeline.phase() == PipelinePhase::Shuffling);
    assert(pipeline.RequestBlast(Group{0, {Cell{0, 0}, Cell{1, 0}}}) == BlastStatus::Busy);
    auto started = pipeline.DrainEvents();
    assert(CountStateChanges(started, TileState::Shuffling) == 16);
    assert(PhaseMessages(started) ==
           std::vector<PipelineEventType>{PipelineEventType::ShuffleStarted});

    RunToIdle(pipeline);
    assert(pipeline.phase() == PipelinePhase::Idle);
    auto finished = pipeline.DrainEvents();
    assert(CountStateChanges(finished, TileState::Idle) == 16);
    assert((PhaseMessages(finished) ==
            std::vector<PipelineEventType>{PipelineEventType::ShuffleComplete,
                                           PipelineEventType::Ready}));

    assert(pipeline.lastShuffle().has_value());
    assert(pipeline.lastShuffle()->guaranteed.size() == 1);
    assert(!pipeline.lastShuffle()->still_deadlocked);
    assert(!IsDeadlocked(pipeline.board(), 2));
    CheckSettledBoard(pipeline);
}

// A 2x2 board with six colors: after the bottom pair is blasted the refill
// often leaves no pair, and the pipeline has to shuffle before it is Ready.
void TestDeadlockAfterRefillShuffles() {
    int shuffled = 0;
    for (std::uint32_t seed = 1; seed <= 300; ++seed) {
        auto config = MakeConfig(2, 2, 6);
        config.initial_layout = {0, 0, 1, 2};
        config.seed = seed;
        Pipeline pipeline(config);
        pipeline.Start();
        assert(pipeline.phase() == PipelinePhase::Idle);
        pipeline.DrainEvents();

        auto group = pipeline.EvaluateMove(0, 0);
        assert(group && group->size() == 2);
        assert(pipeline.RequestBlast(*group) == BlastStatus::Started);
        assert(pipeline.CompleteBlast());
        assert(pipeline.phase() == PipelinePhase::Falling);
        for (const auto& tile : pipeline.board().allTiles()) {
            if (tile.state != TileState::Idle) {
                assert(pipeline.SettleTile(tile.id));
            }
        }
        pipeline.Update();
        const bool deadlocked = pipeline.phase() == PipelinePhase::Shuffling;
        assert(deadlocked || pipeline.phase() == PipelinePhase::Idle);
        if (deadlocked) {
            assert(!pipeline.CanProcessInput());
        }

        RunToIdle(pipeline);
        assert(pipeline.phase() == PipelinePhase::Idle);
        const auto messages = PhaseMessages(pipeline.DrainEvents());
        if (deadlocked) {
            ++shuffled;
            assert((messages == std::vector<PipelineEventType>{
                                    PipelineEventType::BlastComplete,
                                    PipelineEventType::GravityComplete,
                                    PipelineEventType::ShuffleStarted,
                                    PipelineEventType::ShuffleComplete,
                                    PipelineEventType::Ready}));
            assert(pipeline.lastShuffle().has_value());
            assert(!pipeline.lastShuffle()->still_deadlocked);
        } else {
            assert((messages == std::vector<PipelineEventType>{
                                    PipelineEventType::BlastComplete,
                                    PipelineEventType::GravityComplete,
                                    PipelineEventType::Ready}));
            assert(!pipeline.lastShuffle().has_value());
        }
        assert(!IsDeadlocked(pipeline.board(), 2));
        CheckSettledBoard(pipeline);
    }
    assert(shuffled > 0);
}

void TestManualShuffle() {
    Pipeline pipeline(ScenarioConfig());
    pipeline.Start();
    pipeline.DrainEvents();

    assert(pipeline.RequestShuffle());
    assert(pipeline.phase() == PipelinePhase::Shuffling);
    RunToIdle(pipeline);
    assert(pipeline.phase() == PipelinePhase::Idle);
    assert(pipeline.lastShuffle().has_value());
    assert(pipeline.lastShuffle()->mapping.size() == 9);
    CheckSettledBoard(pipeline);
}

void TestManyCycles() {
    auto config = MakeConfig(8, 10, 5);
    config.guaranteed_color_count = 2;
    config.seed = 3;
    Pipeline pipeline(config);
    pipeline.Start();
    RunToIdle(pipeline);

    for (int move = 0; move < 40; ++move) {
        assert(pipeline.phase() == PipelinePhase::Idle);
        std::optional<Group> group;
        for (int row = 0; row < 10 && !group; ++row) {
            for (int col = 0; col < 8 && !group; ++col) {
                group = pipeline.EvaluateMove(col, row);
            }
        }
        assert(group.has_value());
        assert(pipeline.RequestBlast(*group) == BlastStatus::Started);
        RunToIdle(pipeline);
        assert(pipeline.phase() == PipelinePhase::Idle);
        assert(!IsDeadlocked(pipeline.board(), 2));
        CheckSettledBoard(pipeline);
        pipeline.DrainEvents();
    }
}

void TestRestartRebuildsFromSeed() {
    auto config = MakeConfig(5, 5, 4);
    config.seed = 42;
    Pipeline pipeline(config);
    pipeline.Start();
    RunToIdle(pipeline);

    auto group = pipeline.EvaluateMove(0, 0);
    for (int row = 0; row < 5 && !group; ++row) {
        for (int col = 0; col < 5 && !group; ++col) {
            group = pipeline.EvaluateMove(col, row);
        }
    }
    assert(group.has_value());
    assert(pipeline.RequestBlast(*group) == BlastStatus::Started);

    pipeline.Restart();
    RunToIdle(pipeline);
    assert(pipeline.phase() == PipelinePhase::Idle);
    Pipeline fresh(config);
    fresh.Start();
    RunToIdle(fresh);
    for (int row = 0; row < 5; ++row) {
        for (int col = 0; col < 5; ++col) {
            assert(pipeline.board().colorAt(col, row) == fresh.board().colorAt(col, row));
        }
    }
}

}  // namespace

int main() {
    TestStartOnPlayableBoard();
    TestBlastCycleHoldsTheLock();
    TestInvalidRequestsChangeNothing();
    TestDeadlockedStartShuffles();
    TestDeadlockAfterRefillShuffles();
    TestManualShuffle();
    TestManyCycles();
    TestRestartRebuildsFromSeed();
    std::cout << "All pipeline tests passed.\n";
    return 0;
}
