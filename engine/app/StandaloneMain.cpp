#define SDL_MAIN_HANDLED

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_main.h>

#include "blast/app/AssetFS.hpp"
#include "blast/core/Pipeline.hpp"
#include "blast/platform/SdlInput.hpp"
#include "blast/render/SceneRenderer.hpp"

using blast::app::AssetPath;
using blast::app::LoadConfig;
using blast::core::Cell;
using blast::core::Group;
using blast::core::Pipeline;
using blast::core::PipelineEvent;
using blast::core::PipelineEventType;
using blast::core::TileId;
using blast::core::TileState;
using blast::platform::InputEventType;
using blast::platform::KeyCode;
using blast::platform::MouseButton;
using blast::platform::SdlInput;
using blast::render::Animation;
using blast::render::BoardRenderData;
using blast::render::ComputeLayout;
using blast::render::DrawAnimations;
using blast::render::DrawBoard;
using blast::render::MakeFallAnimation;
using blast::render::MakePopAnimation;
using blast::render::MakeShuffleAnimation;
using blast::render::MakeSpawnAnimation;
using blast::render::UpdateAnimations;
using Layout = blast::render::Layout;
using blast::render::kFallDurationMinMs;
using blast::render::kFallDurationPerCellMs;
using blast::render::kPopDurationMs;
using blast::render::kShuffleDurationMs;

namespace {

constexpr int kWindowWidth = 720;
constexpr int kWindowHeight = 900;
constexpr const char* kConfigFile = "blast.json";

struct ViewState {
    Layout layout;
    std::vector<Animation> animations;
    std::set<TileId> hidden_tiles;
    std::optional<Cell> hover;
    std::optional<Group> hover_group;
    int pending_pops = 0;
};

float FallDuration(const Cell& from, const Cell& to) {
    const int distance = std::abs(from.row - to.row);
    return std::max(kFallDurationMinMs, distance * kFallDurationPerCellMs);
}

// Turns pipeline messages into tweens. Every tile that has to settle gets
// exactly one animation carrying its id.
void QueueAnimations(ViewState& view, const Pipeline& pipeline, const std::vector<PipelineEvent>& events) {
    for (const auto& event : events) {
        switch (event.type) {
            case PipelineEventType::TileStateChanged:
                if (event.new_state == TileState::Blasting) {
                    view.animations.push_back(MakePopAnimation(view.layout, event.tile.cell(),
                                                               event.tile.id, event.tile.color,
                                                               kPopDurationMs));
                    view.hidden_tiles.insert(event.tile.id);
                    ++view.pending_pops;
                }
                break;
            case PipelineEventType::GravityComplete:
                for (const auto& move : event.gravity.fell) {
                    view.animations.push_back(MakeFallAnimation(view.layout, move.from, move.to,
                                                                move.tile, move.color,
                                                                FallDuration(move.from, move.to)));
                    view.hidden_tiles.insert(move.tile);
                }
                for (const auto& move : event.gravity.spawned) {
                    view.animations.push_back(MakeSpawnAnimation(view.layout, move.from, move.to,
                                                                 move.tile, move.color,
                                                                 FallDuration(move.from, move.to)));
                    view.hidden_tiles.insert(move.tile);
                }
                break;
            case PipelineEventType::ShuffleStarted:
                for (const auto& assignment : event.shuffle.mapping) {
                    const auto* tile = pipeline.board().find(assignment.tile);
                    const int color = tile ? tile->color : blast::core::kEmptyCell;
                    view.animations.push_back(MakeShuffleAnimation(view.layout, assignment.from,
                                                                   assignment.to, assignment.tile,
                                                                   color, kShuffleDurationMs));
                    view.hidden_tiles.insert(assignment.tile);
                }
                break;
            case PipelineEventType::ShuffleComplete:
                if (event.shuffle.emergency_fix_applied) {
                    SDL_Log("Shuffle recolored %d tiles",
                            static_cast<int>(event.shuffle.recolored.size()));
                }
                break;
            case PipelineEventType::Ready:
                SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Board ready for input");
                break;
            case PipelineEventType::BlastComplete:
                break;
        }
    }
}

void HandleFinished(ViewState& view, Pipeline& pipeline, const std::vector<Animation>& finished) {
    bool pops_done = false;
    for (const auto& anim : finished) {
        if (anim.type == Animation::Type::Pop) {
            view.pending_pops = std::max(0, view.pending_pops - 1);
            pops_done = pops_done || view.pending_pops == 0;
            continue;
        }
        if (anim.tile && !pipeline.SettleTile(*anim.tile)) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Tile %u could not settle", *anim.tile);
        }
    }
    if (pops_done) {
        pipeline.CompleteBlast();
    }
}

void UpdateHover(ViewState& view, const Pipeline& pipeline, int x, int y) {
    view.hover = blast::render::CellAt(view.layout, x, y);
    view.hover_group.reset();
    if (view.hover && !pipeline.processing()) {
        view.hover_group = pipeline.EvaluateMove(view.hover->col, view.hover->row);
    }
}

void HandleClick(ViewState& view, Pipeline& pipeline, int x, int y) {
    const auto cell = blast::render::CellAt(view.layout, x, y);
    if (!cell || !pipeline.CanProcessInput()) {
        return;
    }
    const auto group = pipeline.EvaluateMove(cell->col, cell->row);
    if (!group) {
        return;
    }
    const auto status = pipeline.RequestBlast(*group);
    if (status != blast::core::BlastStatus::Started) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Blast rejected: %s",
                    blast::core::ToString(status));
    }
    view.hover_group.reset();
}

void ResetView(ViewState& view) {
    view.animations.clear();
    view.hidden_tiles.clear();
    view.hover_group.reset();
    view.pending_pops = 0;
}

void UpdateWindowTitle(SDL_Window* window, const Pipeline& pipeline) {
    std::string title = "Blast - ";
    title += blast::core::ToString(pipeline.phase());
    SDL_SetWindowTitle(window, title.c_str());
}

}  // namespace

int main(int argc, char* argv[]) {
    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_Init failed: %s", SDL_GetError());
        return 1;
    }

    const std::filesystem::path config_path =
        argc > 1 ? std::filesystem::path(argv[1]) : AssetPath(kConfigFile);
    Pipeline pipeline(LoadConfig(config_path));
    const int cols = pipeline.board().cols();
    const int rows = pipeline.board().rows();

    SDL_Window* window =
        SDL_CreateWindow("Blast", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, kWindowWidth,
                         kWindowHeight, SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateWindow failed: %s", SDL_GetError());
        SDL_Quit();
        return 1;
    }
    SDL_Renderer* renderer =
        SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateRenderer failed: %s", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    int window_w = kWindowWidth;
    int window_h = kWindowHeight;
    SDL_GetRendererOutputSize(renderer, &window_w, &window_h);

    ViewState view;
    view.layout = ComputeLayout(window_w, window_h, cols, rows);

    pipeline.Start();
    QueueAnimations(view, pipeline, pipeline.DrainEvents());

    SdlInput input;
    const Uint64 frequency = SDL_GetPerformanceFrequency();
    Uint64 last_counter = SDL_GetPerformanceCounter();
    bool running = true;

    while (running) {
        for (const auto& evt : input.Poll()) {
            switch (evt.type) {
                case InputEventType::Quit:
                    running = false;
                    break;
                case InputEventType::MouseMove:
                    UpdateHover(view, pipeline, evt.x, evt.y);
                    break;
                case InputEventType::MouseButtonDown:
                    if (evt.mouse_button == MouseButton::Left) {
                        HandleClick(view, pipeline, evt.x, evt.y);
                    }
                    break;
                case InputEventType::KeyDown:
                    switch (evt.key) {
                        case KeyCode::Escape:
                            running = false;
                            break;
                        case KeyCode::S:
                            if (!pipeline.RequestShuffle()) {
                                SDL_Log("Shuffle ignored while %s",
                                        blast::core::ToString(pipeline.phase()));
                            }
                            break;
                        case KeyCode::R:
                            ResetView(view);
                            pipeline.Restart();
                            break;
                        case KeyCode::Unknown:
                            break;
                    }
                    break;
                case InputEventType::WindowResized:
                    SDL_GetRendererOutputSize(renderer, &window_w, &window_h);
                    view.layout = ComputeLayout(window_w, window_h, cols, rows);
                    break;
            }
        }

        const Uint64 now = SDL_GetPerformanceCounter();
        const float delta_ms = static_cast<float>((now - last_counter) * 1000.0 / frequency);
        last_counter = now;

        QueueAnimations(view, pipeline, pipeline.DrainEvents());
        HandleFinished(view, pipeline, UpdateAnimations(view.animations, view.hidden_tiles, delta_ms));
        pipeline.Update();
        QueueAnimations(view, pipeline, pipeline.DrainEvents());
        UpdateWindowTitle(window, pipeline);

        SDL_SetRenderDrawColor(renderer, 10, 10, 12, 255);
        SDL_RenderClear(renderer);
        const std::vector<Cell>* hover_cells = view.hover_group ? &view.hover_group->cells : nullptr;
        BoardRenderData board_data{pipeline.board(), view.hidden_tiles, view.hover, hover_cells};
        DrawBoard(renderer, board_data, view.layout);
        DrawAnimations(renderer, view.animations, view.layout);
        SDL_RenderPresent(renderer);
    }

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
