#include "blast/core/Pipeline.hpp"

#include <utility>

#include <SDL2/SDL_log.h>

#include "blast/core/Gravity.hpp"

namespace blast::core {

const char* ToString(PipelinePhase phase) noexcept {
    switch (phase) {
        case PipelinePhase::Idle:
            return "Idle";
        case PipelinePhase::Blasting:
            return "Blasting";
        case PipelinePhase::Falling:
            return "Falling";
        case PipelinePhase::Shuffling:
            return "Shuffling";
    }
    return "Unknown";
}

Pipeline::Pipeline(GameConfig config)
    : config_(std::move(config)),
      board_(NewBoard(config_)),
      lifecycle_(board_, events_),
      blast_(board_, lifecycle_),
      shuffle_(board_, lifecycle_, config_.palette) {}

void Pipeline::Start() {
    events_.clear();
    awaiting_.clear();
    last_shuffle_.reset();
    blast_.Reset();
    phase_ = PipelinePhase::Idle;

    RefreshGroupMetadata(board_, config_.palette);
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Board ready: %dx%d", board_.cols(), board_.rows());

    if (IsDeadlocked(board_, config_.palette.min_group_size)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Initial board is deadlocked, shuffling");
        BeginShuffle();
        return;
    }
    Emit(PipelineEventType::Ready);
}

void Pipeline::Restart() {
    board_ = NewBoard(config_);
    Start();
}

bool Pipeline::CanProcessInput() const {
    if (processing()) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Input blocked while %s", ToString(phase_));
        return false;
    }
    return true;
}

std::optional<Group> Pipeline::EvaluateMove(int col, int row) const {
    return FindGroup(board_, col, row, config_.palette.min_group_size);
}

BlastStatus Pipeline::RequestBlast(const Group& group) {
    if (!CanProcessInput()) {
        return BlastStatus::Busy;
    }
    const BlastStatus status = blast_.Begin(group, config_.palette.min_group_size);
    if (status != BlastStatus::Started) {
        return status;
    }
    phase_ = PipelinePhase::Blasting;
    return status;
}

bool Pipeline::RequestShuffle() {
    if (!CanProcessInput()) {
        return false;
    }
    BeginShuffle();
    return true;
}

bool Pipeline::CompleteBlast() {
    if (phase_ != PipelinePhase::Blasting) {
        return false;
    }

    PipelineEvent blasted;
    blasted.type = PipelineEventType::BlastComplete;
    blasted.removed = blast_.Finish();
    events_.push_back(std::move(blasted));

    GravityResult gravity = ApplyGravityAndRefill(board_, lifecycle_);
    awaiting_.clear();
    for (const auto& move : gravity.fell) {
        awaiting_.push_back(move.tile);
    }
    for (const auto& move : gravity.spawned) {
        awaiting_.push_back(move.tile);
    }

    PipelineEvent fallen;
    fallen.type = PipelineEventType::GravityComplete;
    fallen.gravity = std::move(gravity);
    events_.push_back(std::move(fallen));

    phase_ = PipelinePhase::Falling;
    return true;
}

bool Pipeline::SettleTile(TileId id) {
    const Tile* tile = board_.find(id);
    if (tile == nullptr) {
        return false;
    }
    if (tile->state == TileState::Idle) {
        return true;
    }
    return lifecycle_.Transition(id, TileState::Idle);
}

void Pipeline::Update() {
    if (!AllSettled()) {
        return;
    }
    switch (phase_) {
        case PipelinePhase::Falling:
            FinishFalling();
            break;
        case PipelinePhase::Shuffling:
            FinishShuffle();
            break;
        case PipelinePhase::Idle:
        case PipelinePhase::Blasting:
            break;
    }
}

std::vector<PipelineEvent> Pipeline::DrainEvents() {
    std::vector<PipelineEvent> drained;
    drained.swap(events_);
    return drained;
}

bool Pipeline::AllSettled() const {
    for (const TileId id : awaiting_) {
        const Tile* tile = board_.find(id);
        if (tile != nullptr && tile->state != TileState::Idle) {
            return false;
        }
    }
    return true;
}

void Pipeline::FinishFalling() {
    awaiting_.clear();
    RefreshGroupMetadata(board_, config_.palette);
    if (IsDeadlocked(board_, config_.palette.min_group_size)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Deadlock after gravity, shuffling");
        BeginShuffle();
        return;
    }
    FinishProcessing();
}

void Pipeline::BeginShuffle() {
    pending_shuffle_ = shuffle_.Plan(config_.guaranteed_color_count);
    shuffle_.Commit(pending_shuffle_);

    awaiting_.clear();
    for (const auto& assignment : pending_shuffle_.mapping) {
        awaiting_.push_back(assignment.tile);
    }

    PipelineEvent started;
    started.type = PipelineEventType::ShuffleStarted;
    started.shuffle = pending_shuffle_;
    events_.push_back(std::move(started));

    phase_ = PipelinePhase::Shuffling;
}

void Pipeline::FinishShuffle() {
    awaiting_.clear();
    shuffle_.Finalize(pending_shuffle_);
    last_shuffle_ = pending_shuffle_;

    PipelineEvent done;
    done.type = PipelineEventType::ShuffleComplete;
    done.shuffle = std::move(pending_shuffle_);
    pending_shuffle_ = ShuffleResult{};
    events_.push_back(std::move(done));

    FinishProcessing();
}

void Pipeline::FinishProcessing() {
    phase_ = PipelinePhase::Idle;
    Emit(PipelineEventType::Ready);
}

void Pipeline::Emit(PipelineEventType type) {
    PipelineEvent event;
    event.type = type;
    events_.push_back(std::move(event));
}

}  // namespace blast::core
