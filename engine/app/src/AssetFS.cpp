#include "tilemerge/app/AssetFS.hpp"

#include <SDL2/SDL.h>

#include <cstdlib>
#include <mutex>
#include <vector>

namespace tilemerge::app {

namespace {

std::vector<std::filesystem::path> SearchRoots() {
    std::vector<std::filesystem::path> roots;
    if (const char* env = std::getenv("TILEMERGE_ASSETS")) {
        roots.emplace_back(env);
    }
    // The build copies assets/ next to the executable.
    if (char* base = SDL_GetBasePath()) {
        roots.push_back(std::filesystem::path(base) / "assets");
        SDL_free(base);
    }
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        roots.push_back(cwd / "assets");
    }
    return roots;
}

const std::vector<std::filesystem::path>& CachedRoots() {
    static std::vector<std::filesystem::path> roots;
    static std::once_flag once;
    std::call_once(once, [] { roots = SearchRoots(); });
    return roots;
}

}  // namespace

bool FileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::filesystem::path AssetPath(const std::string& filename) {
    for (const auto& root : CachedRoots()) {
        std::filesystem::path candidate = root / filename;
        if (FileExists(candidate)) {
            return candidate;
        }
    }
    return std::filesystem::path(filename);
}

}  // namespace tilemerge::app
