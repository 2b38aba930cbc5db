#include "krep/config/default_config.hpp"

#include "core/logging/logger.hpp"
#include "krep/config/config_file.hpp"

#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace krep::config {

DefaultConfigPaths StandardDefaultConfigPaths() {
  DefaultConfigPaths paths;
  paths.system_path = kSystemConfigPath;

  const char* home = std::getenv("HOME");
  if (home != nullptr && *home != '\0') {
    paths.user_path = fs::path(home) / kUserConfigFileName;
  }
  return paths;
}

bool LoadConfigFileDefaults(const fs::path& path, options::Values& values, std::string& error) {
  values = options::Values{};
  if (path.empty()) {
    return true;
  }

  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    return true;
  }

  ConfigFile config;
  if (!ReadConfigFile(path, config, error)) {
    return false;
  }
  values = config.Defaults();
  return true;
}

const options::Values& DefaultConfigLoader::Load() {
  const options::Values* cached = cached_.load(std::memory_order_acquire);
  if (cached != nullptr) {
    return *cached;
  }

  std::lock_guard<std::mutex> lock(mu_);
  cached = cached_.load(std::memory_order_relaxed);
  if (cached != nullptr) {
    return *cached;
  }

  storage_ = std::make_unique<options::Values>(ReadAll());
  load_count_.fetch_add(1U, std::memory_order_release);
  cached_.store(storage_.get(), std::memory_order_release);
  return *storage_;
}

options::Values DefaultConfigLoader::ReadAll() const {
  const auto& logger = core::logging::GetLogger();

  options::Values merged;
  for (const fs::path& path : {paths_.system_path, paths_.user_path}) {
    options::Values file_values;
    std::string error;
    if (!LoadConfigFileDefaults(path, file_values, error)) {
      logger.Warn("ignoring unreadable config file", {{"path", path.string()}, {"error", error}});
      continue;
    }
    merged.Join(file_values, /*override=*/false);
  }
  return merged;
}

} // namespace krep::config
