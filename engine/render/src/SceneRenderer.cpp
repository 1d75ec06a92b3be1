#include "blast/render/SceneRenderer.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace blast::render {

namespace {

const std::array<Color, 6> kTileColors{{
    Color{238, 84, 76, 255},
    Color{97, 219, 112, 255},
    Color{98, 142, 255, 255},
    Color{255, 207, 65, 255},
    Color{177, 102, 235, 255},
    Color{255, 128, 196, 255},
}};

SDL_Color ToSdl(Color color) {
    return SDL_Color{color.r, color.g, color.b, color.a};
}

SDL_FRect MakeRect(float center_x, float center_y, float half) {
    return SDL_FRect{center_x - half, center_y - half, half * 2.0f, half * 2.0f};
}

void DrawTierMarker(SDL_Renderer* renderer, const SDL_FRect& rect, blast::core::IconTier tier) {
    const int rings = static_cast<int>(tier);
    if (rings <= 0) {
        return;
    }
    SDL_SetRenderDrawColor(renderer, 255, 255, 255, 190);
    const float step = std::max(2.0f, rect.w * 0.08f);
    for (int i = 1; i <= rings; ++i) {
        const float inset = step * static_cast<float>(i);
        SDL_FRect ring{rect.x + inset, rect.y + inset, rect.w - 2.0f * inset,
                       rect.h - 2.0f * inset};
        if (ring.w <= 0.0f || ring.h <= 0.0f) {
            break;
        }
        SDL_RenderDrawRectF(renderer, &ring);
    }
}

Animation MakeMove(Animation::Type type,
                   const Layout& layout,
                   const blast::core::Cell& from,
                   const blast::core::Cell& to,
                   blast::core::TileId tile,
                   int color,
                   float duration_ms) {
    Animation anim;
    anim.type = type;
    anim.duration_ms = duration_ms;
    const SDL_FPoint from_pt = CellCenter(layout, from);
    const SDL_FPoint to_pt = CellCenter(layout, to);
    anim.start_x = from_pt.x;
    anim.start_y = from_pt.y;
    anim.end_x = to_pt.x;
    anim.end_y = to_pt.y;
    anim.color = TileColor(color);
    anim.tile = tile;
    return anim;
}

}  // namespace

bool Animation::started() const {
    return elapsed_ms >= delay_ms;
}

bool Animation::finished() const {
    return elapsed_ms >= delay_ms + duration_ms;
}

float Animation::progress() const {
    if (!started()) {
        return 0.0f;
    }
    if (duration_ms <= 0.0f) {
        return 1.0f;
    }
    const float t = (elapsed_ms - delay_ms) / duration_ms;
    return std::clamp(t, 0.0f, 1.0f);
}

float Animation::ease() const {
    const float t = progress();
    return t * t * (3.0f - 2.0f * t);
}

Layout ComputeLayout(int window_w, int window_h, int cols, int rows, int margin_px) {
    const float width = static_cast<float>(window_w);
    const float height = static_cast<float>(window_h);
    const float margin =
        std::max(static_cast<float>(margin_px), std::min(width, height) * 0.025f);

    const float available_width = std::max(0.0f, width - margin * 2.0f);
    const float available_height = std::max(0.0f, height - margin * 2.0f);
    const float cell_size = std::max(
        1.0f, std::min(available_width / static_cast<float>(cols),
                       available_height / static_cast<float>(rows)));

    Layout layout{};
    layout.cols = cols;
    layout.rows = rows;
    layout.cell_size = cell_size;
    layout.board_left = (width - cell_size * static_cast<float>(cols)) * 0.5f;
    layout.board_top = (height - cell_size * static_cast<float>(rows)) * 0.5f;
    layout.cell_inset = std::max(1.0f, cell_size * 0.04f);
    layout.grid_line_alpha = 35.0f;
    return layout;
}

SDL_FPoint CellCenter(const Layout& layout, const blast::core::Cell& cell) {
    // Rows above the board (spawn origins) land above the top edge.
    const int screen_row = layout.rows - 1 - cell.row;
    SDL_FPoint point;
    point.x = layout.board_left + (static_cast<float>(cell.col) + 0.5f) * layout.cell_size;
    point.y = layout.board_top + (static_cast<float>(screen_row) + 0.5f) * layout.cell_size;
    return point;
}

std::optional<blast::core::Cell> CellAt(const Layout& layout, int x, int y) {
    if (layout.cell_size <= 0.0f) {
        return std::nullopt;
    }
    const float local_x = static_cast<float>(x) - layout.board_left;
    const float local_y = static_cast<float>(y) - layout.board_top;
    if (local_x < 0.0f || local_y < 0.0f) {
        return std::nullopt;
    }
    const int col = static_cast<int>(std::floor(local_x / layout.cell_size));
    const int screen_row = static_cast<int>(std::floor(local_y / layout.cell_size));
    if (col >= layout.cols || screen_row >= layout.rows) {
        return std::nullopt;
    }
    return blast::core::Cell{col, layout.rows - 1 - screen_row};
}

Color TileColor(int color) {
    if (color < 0) {
        return Color{64, 64, 64, 255};
    }
    return kTileColors[static_cast<std::size_t>(color) % kTileColors.size()];
}

Animation MakePopAnimation(const Layout& layout,
                           const blast::core::Cell& cell,
                           blast::core::TileId tile,
                           int color,
                           float duration_ms) {
    Animation anim = MakeMove(Animation::Type::Pop, layout, cell, cell, tile, color, duration_ms);
    anim.size_start = 1.0f;
    anim.size_end = 0.4f;
    anim.alpha_start = 255.0f;
    anim.alpha_end = 0.0f;
    return anim;
}

Animation MakeFallAnimation(const Layout& layout,
                            const blast::core::Cell& from,
                            const blast::core::Cell& to,
                            blast::core::TileId tile,
                            int color,
                            float duration_ms) {
    return MakeMove(Animation::Type::Fall, layout, from, to, tile, color, duration_ms);
}

Animation MakeSpawnAnimation(const Layout& layout,
                             const blast::core::Cell& from,
                             const blast::core::Cell& to,
                             blast::core::TileId tile,
                             int color,
                             float duration_ms) {
    Animation anim = MakeMove(Animation::Type::Spawn, layout, from, to, tile, color, duration_ms);
    anim.alpha_start = 120.0f;
    anim.alpha_end = 255.0f;
    return anim;
}

Animation MakeShuffleAnimation(const Layout& layout,
                               const blast::core::Cell& from,
                               const blast::core::Cell& to,
                               blast::core::TileId tile,
                               int color,
                               float duration_ms) {
    Animation anim =
        MakeMove(Animation::Type::Shuffle, layout, from, to, tile, color, duration_ms);
    anim.size_start = 0.7f;
    anim.size_end = 1.0f;
    return anim;
}

std::vector<Animation> UpdateAnimations(std::vector<Animation>& animations,
                                        std::set<blast::core::TileId>& hidden_tiles,
                                        float delta_ms) {
    for (auto& anim : animations) {
        anim.elapsed_ms += delta_ms;
    }

    std::vector<Animation> finished;
    auto it = animations.begin();
    while (it != animations.end()) {
        if (it->finished()) {
            if (it->tile) {
                hidden_tiles.erase(*it->tile);
            }
            finished.push_back(*it);
            it = animations.erase(it);
        } else {
            ++it;
        }
    }
    return finished;
}

void DrawBoard(SDL_Renderer* renderer, const BoardRenderData& board_data, const Layout& layout) {
    const int cols = board_data.board.cols();
    const int rows = board_data.board.rows();

    SDL_SetRenderDrawColor(renderer, 255, 255, 255, static_cast<Uint8>(layout.grid_line_alpha));
    for (int c = 0; c <= cols; ++c) {
        const int x = static_cast<int>(layout.board_left + c * layout.cell_size);
        SDL_RenderDrawLine(renderer, x, static_cast<int>(layout.board_top), x,
                           static_cast<int>(layout.board_top + layout.cell_size * rows));
    }
    for (int r = 0; r <= rows; ++r) {
        const int y = static_cast<int>(layout.board_top + r * layout.cell_size);
        SDL_RenderDrawLine(renderer, static_cast<int>(layout.board_left), y,
                           static_cast<int>(layout.board_left + layout.cell_size * cols), y);
    }

    auto in_hover_group = [&](const blast::core::Cell& cell) {
        if (!board_data.hover_group) {
            return false;
        }
        const auto& group = *board_data.hover_group;
        return std::find(group.begin(), group.end(), cell) != group.end();
    };

    const float base = layout.cell_size - 2.0f * layout.cell_inset;
    board_data.board.forEach([&](const blast::core::Tile& tile) {
        if (board_data.hidden_tiles.count(tile.id) > 0) {
            return;
        }
        const blast::core::Cell cell = tile.cell();
        const bool highlight = in_hover_group(cell) ||
                               (board_data.hover && *board_data.hover == cell);
        const float scale = highlight ? 1.08f : 1.0f;
        const SDL_FPoint center = CellCenter(layout, cell);
        const float half = std::min(0.5f * base * scale, 0.5f * layout.cell_size);
        const SDL_FRect rect = MakeRect(center.x, center.y, half);

        const SDL_Color color = ToSdl(TileColor(tile.color));
        SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, 255);
        SDL_RenderFillRectF(renderer, &rect);
        DrawTierMarker(renderer, rect, tile.icon);

        if (highlight) {
            SDL_SetRenderDrawColor(renderer, 255, 255, 255, 220);
            SDL_RenderDrawRectF(renderer, &rect);
        }
    });
}

void DrawAnimations(SDL_Renderer* renderer,
                    const std::vector<Animation>& animations,
                    const Layout& layout) {
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    const float base = layout.cell_size - 2.0f * layout.cell_inset;

    for (const auto& anim : animations) {
        const float ease = anim.ease();
        const float x = anim.start_x + (anim.end_x - anim.start_x) * ease;
        const float y = anim.start_y + (anim.end_y - anim.start_y) * ease;
        const float size = anim.size_start + (anim.size_end - anim.size_start) * ease;
        const float alpha_f = anim.alpha_start + (anim.alpha_end - anim.alpha_start) * ease;
        const SDL_FRect rect = MakeRect(x, y, 0.5f * base * size);
        SDL_Color color = ToSdl(anim.color);
        color.a = static_cast<Uint8>(std::clamp(alpha_f, 0.0f, 255.0f));

        SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
        SDL_RenderFillRectF(renderer, &rect);
    }
}

}  // namespace blast::render
