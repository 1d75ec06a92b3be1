#pragma once

#include <SDL2/SDL.h>

#include <optional>
#include <set>
#include <vector>

#include "blast/core/Board.hpp"

namespace blast::render {

// Board geometry in window pixels. Row 0 is drawn at the bottom.
struct Layout {
    float board_left{};
    float board_top{};
    float cell_size{};
    float cell_inset{};
    float grid_line_alpha{};
    int cols{};
    int rows{};
};

struct Color {
    Uint8 r{255};
    Uint8 g{255};
    Uint8 b{255};
    Uint8 a{255};
};

struct Animation {
    enum class Type { Pop, Fall, Spawn, Shuffle };

    Type type = Type::Pop;
    float duration_ms = 0.0f;
    float delay_ms = 0.0f;
    float elapsed_ms = 0.0f;
    float size_start = 1.0f;
    float size_end = 1.0f;
    float alpha_start = 255.0f;
    float alpha_end = 255.0f;
    float start_x = 0.0f;
    float start_y = 0.0f;
    float end_x = 0.0f;
    float end_y = 0.0f;
    Color color{};
    // Tile hidden on the static board while this plays.
    std::optional<blast::core::TileId> tile;

    bool started() const;
    bool finished() const;
    float progress() const;
    float ease() const;
};

struct BoardRenderData {
    const blast::core::Board& board;
    const std::set<blast::core::TileId>& hidden_tiles;
    std::optional<blast::core::Cell> hover;
    // Cells of the group under the cursor.
    const std::vector<blast::core::Cell>* hover_group = nullptr;
};

inline constexpr float kPopDurationMs = 200.0f;
inline constexpr float kFallDurationPerCellMs = 55.0f;
inline constexpr float kFallDurationMinMs = 120.0f;
inline constexpr float kShuffleDurationMs = 420.0f;

Layout ComputeLayout(int window_w, int window_h, int cols, int rows, int margin_px = 40);

SDL_FPoint CellCenter(const Layout& layout, const blast::core::Cell& cell);

// Pointer-to-grid mapping; nullopt outside the board.
std::optional<blast::core::Cell> CellAt(const Layout& layout, int x, int y);

Color TileColor(int color);

Animation MakePopAnimation(const Layout& layout,
                           const blast::core::Cell& cell,
                           blast::core::TileId tile,
                           int color,
                           float duration_ms);
Animation MakeFallAnimation(const Layout& layout,
                            const blast::core::Cell& from,
                            const blast::core::Cell& to,
                            blast::core::TileId tile,
                            int color,
                            float duration_ms);
Animation MakeSpawnAnimation(const Layout& layout,
                             const blast::core::Cell& from,
                             const blast::core::Cell& to,
                             blast::core::TileId tile,
                             int color,
                             float duration_ms);
Animation MakeShuffleAnimation(const Layout& layout,
                               const blast::core::Cell& from,
                               const blast::core::Cell& to,
                               blast::core::TileId tile,
                               int color,
                               float duration_ms);

// Advances every animation and returns the ones that finished this frame.
// Their tiles are removed from hidden_tiles.
std::vector<Animation> UpdateAnimations(std::vector<Animation>& animations,
                                        std::set<blast::core::TileId>& hidden_tiles,
                                        float delta_ms);

void DrawBoard(SDL_Renderer* renderer, const BoardRenderData& board_data, const Layout& layout);
void DrawAnimations(SDL_Renderer* renderer,
                    const std::vector<Animation>& animations,
                    const Layout& layout);

}  // namespace blast::render
