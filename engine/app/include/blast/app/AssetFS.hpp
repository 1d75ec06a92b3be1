#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "blast/core/GameConfig.hpp"

namespace blast::app {

bool FileExists(const std::filesystem::path& path);

// Directories searched for data files: BLAST_ASSETS, the working directory
// and the executable's directory, each walked up towards the root.
const std::vector<std::filesystem::path>& AssetRoots();

std::filesystem::path AssetPath(const std::string& filename);

std::optional<std::string> ReadTextFile(const std::filesystem::path& path);

// Reads and parses a config file. Missing files and malformed JSON are logged
// and yield the defaults.
blast::core::GameConfig LoadConfig(const std::filesystem::path& path);

}  // namespace blast::app
