#include "blast/app/AssetFS.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <sstream>

namespace blast::app {

namespace {

void PushIfExists(std::vector<std::filesystem::path>& roots, const std::filesystem::path& path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        return;
    }
    if (std::find(roots.begin(), roots.end(), path) == roots.end()) {
        roots.push_back(path);
    }
}

void HarvestAssetDirs(std::vector<std::filesystem::path>& roots,
                      const std::filesystem::path& start,
                      int max_depth) {
    std::filesystem::path cursor = start;
    for (int depth = 0; depth < max_depth && !cursor.empty(); ++depth) {
        PushIfExists(roots, cursor / "assets");
        const auto parent = cursor.parent_path();
        if (parent == cursor) {
            break;
        }
        cursor = parent;
    }
}

}  // namespace

bool FileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

const std::vector<std::filesystem::path>& AssetRoots() {
    static std::vector<std::filesystem::path> roots;
    static std::once_flag init_flag;
    std::call_once(init_flag, [] {
        if (const char* env = std::getenv("BLAST_ASSETS")) {
            PushIfExists(roots, std::filesystem::path(env));
            HarvestAssetDirs(roots, std::filesystem::path(env), 2);
        }

        std::error_code ec;
        const auto cwd = std::filesystem::current_path(ec);
        if (!ec) {
            HarvestAssetDirs(roots, cwd, 8);
        }

        if (char* raw_base = SDL_GetBasePath()) {
            std::filesystem::path base_path(raw_base);
            SDL_free(raw_base);
            HarvestAssetDirs(roots, base_path, 8);
        }

        if (roots.empty() && !ec) {
            PushIfExists(roots, cwd);
        }
    });
    return roots;
}

std::filesystem::path AssetPath(const std::string& filename) {
    for (const auto& root : AssetRoots()) {
        std::filesystem::path candidate = root / filename;
        if (FileExists(candidate)) {
            return candidate;
        }
    }
    return std::filesystem::path(filename);
}

std::optional<std::string> ReadTextFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

blast::core::GameConfig LoadConfig(const std::filesystem::path& path) {
    const auto text = ReadTextFile(path);
    if (!text) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Config %s not found, using defaults",
                    path.string().c_str());
        return blast::core::GameConfig{};
    }
    try {
        auto config = blast::core::GameConfig::Deserialize(*text);
        SDL_Log("Loaded config %s: %dx%d, %d colors", path.string().c_str(), config.cols,
                config.rows, config.palette.colorCount());
        return config;
    } catch (const blast::core::Json::exception& ex) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Invalid config %s: %s", path.string().c_str(),
                     ex.what());
        return blast::core::GameConfig{};
    }
}

}  // namespace blast::app
