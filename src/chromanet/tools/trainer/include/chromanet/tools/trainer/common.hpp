#pragma once
#include <cstdlib>
#include <filesystem>
#include <string>

namespace chromanet::tools::trainer {

namespace fs = std::filesystem;

struct DefaultPaths {
  fs::path dataDir;
  fs::path dataFile;
};

inline fs::path locate_project_root(fs::path start) {
  std::error_code ec;
  if (!start.is_absolute()) start = fs::absolute(start, ec);
  while (true) {
    if (fs::exists(start / "CMakeLists.txt", ec)) return start;
    const auto parent = start.parent_path();
    if (parent.empty() || parent == start) return fs::current_path();
    start = parent;
  }
}

inline fs::path default_user_data_dir() {
#ifdef _WIN32
  if (const char* appData = std::getenv("APPDATA"); appData && *appData)
    return fs::path(appData) / "chromanet";
#else
  if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg)
    return fs::path(xdg) / "chromanet";
  if (const char* home = std::getenv("HOME"); home && *home)
    return fs::path(home) / ".local" / "share" / "chromanet";
#endif
  return fs::current_path() / "chromanet_data";
}

// Data lives in <project root>/chromanet_data when running from a build tree,
// otherwise in the per-user data directory.
DefaultPaths compute_default_paths(const char* argv0);

}  // namespace chromanet::tools::trainer
