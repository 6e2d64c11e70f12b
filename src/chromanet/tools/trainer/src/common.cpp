#include "chromanet/tools/trainer/common.hpp"

#include <system_error>

#ifdef _WIN32
  #include <windows.h>
#endif

namespace chromanet::tools::trainer {

DefaultPaths compute_default_paths(const char* argv0) {
  fs::path exePath;
#ifdef _WIN32
  wchar_t buffer[MAX_PATH];
  DWORD len = GetModuleFileNameW(nullptr, buffer, MAX_PATH);
  if (len > 0) exePath.assign(buffer, buffer + len);
  if (exePath.empty() && argv0 && *argv0) exePath = fs::path(argv0);
#else
  std::error_code ec;
  exePath = fs::read_symlink("/proc/self/exe", ec);
  if (ec && argv0 && *argv0) exePath = fs::absolute(fs::path(argv0), ec);
  if (ec) exePath.clear();
#endif
  if (exePath.empty()) exePath = fs::current_path();
  fs::path exeDir = exePath.has_filename() ? exePath.parent_path() : exePath;
  if (exeDir.empty()) exeDir = fs::current_path();

  const fs::path projectRoot = locate_project_root(exeDir);
  const bool hasProjectRoot = fs::exists(projectRoot / "CMakeLists.txt");

  DefaultPaths defaults;
  defaults.dataDir = hasProjectRoot ? projectRoot / "chromanet_data" : default_user_data_dir();
  defaults.dataFile = defaults.dataDir / "color_data.txt";
  return defaults;
}

}  // namespace chromanet::tools::trainer
