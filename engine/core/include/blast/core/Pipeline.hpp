#pragma once

#include <optional>
#include <vector>

#include "blast/core/Blast.hpp"
#include "blast/core/Board.hpp"
#include "blast/core/Events.hpp"
#include "blast/core/GameConfig.hpp"
#include "blast/core/Groups.hpp"
#include "blast/core/Lifecycle.hpp"
#include "blast/core/Shuffle.hpp"

namespace blast::core {

enum class PipelinePhase { Idle, Blasting, Falling, Shuffling };

const char* ToString(PipelinePhase phase) noexcept;

// Drives blast -> gravity -> metadata refresh -> deadlock check -> shuffle.
// Every phase other than Idle holds the processing lock: blast requests are
// rejected, not queued. Phase boundaries wait for external completion:
// CompleteBlast() after the removal effect, SettleTile() for every tile that
// moved. Update() polls the settle set and advances.
class Pipeline {
public:
    explicit Pipeline(GameConfig config);
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Refreshes metadata on the current board and shuffles if it starts out
    // deadlocked. Emits Ready once input is accepted.
    void Start();
    // Rebuilds the board from the config and starts again.
    void Restart();

    const Board& board() const noexcept { return board_; }
    const GameConfig& config() const noexcept { return config_; }
    PipelinePhase phase() const noexcept { return phase_; }
    bool processing() const noexcept { return phase_ != PipelinePhase::Idle; }

    bool CanProcessInput() const;

    std::optional<Group> EvaluateMove(int col, int row) const;
    BlastStatus RequestBlast(const Group& group);
    bool RequestShuffle();

    // External completion signals.
    bool CompleteBlast();
    bool SettleTile(TileId id);

    void Update();

    std::vector<PipelineEvent> DrainEvents();

    const std::optional<ShuffleResult>& lastShuffle() const noexcept { return last_shuffle_; }

private:
    bool AllSettled() const;
    void FinishFalling();
    void BeginShuffle();
    void FinishShuffle();
    void FinishProcessing();
    void Emit(PipelineEventType type);

    GameConfig config_;
    Board board_;
    EventQueue events_;
    TileLifecycle lifecycle_;
    BlastResolver blast_;
    ShuffleResolver shuffle_;

    PipelinePhase phase_ = PipelinePhase::Idle;
    std::vector<TileId> awaiting_;
    ShuffleResult pending_shuffle_;
    std::optional<ShuffleResult> last_shuffle_;
};

}  // namespace blast::core
