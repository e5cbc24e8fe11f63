#pragma once

#include <filesystem>
#include <string>

namespace tilemerge::app {

bool FileExists(const std::filesystem::path& path);

// Looks for `filename` under $TILEMERGE_ASSETS, then `assets/` beside the
// executable, then `assets/` in the working directory. Returns the bare
// filename when none has it.
std::filesystem::path AssetPath(const std::string& filename);

}  // namespace tilemerge::app
