#pragma once

#include "krep/options/values.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace krep::config {

inline constexpr const char* kSystemConfigPath = "/etc/krepconfig";
inline constexpr const char* kUserConfigFileName = ".krepconfig";

// Files read to build the default configuration, highest precedence first.
struct DefaultConfigPaths {
  std::filesystem::path system_path;
  std::filesystem::path user_path;
};

// `/etc/krepconfig` and `$HOME/.krepconfig`. The user path is left empty
// when HOME is not set.
DefaultConfigPaths StandardDefaultConfigPaths();

// Reads the global keys of one config file. A missing file is not an error
// and leaves `values` empty.
bool LoadConfigFileDefaults(const std::filesystem::path& path, options::Values& values,
                            std::string& error);

// Process-wide, lowest-precedence option layer.
//
// The entry point owns one loader and hands the loaded Values to the
// dispatcher by reference. Load() builds the set on first use and returns the
// same object afterwards:
// - fast path: an acquire-load of the published pointer
// - slow path: lock, re-check, read both files, publish
// Concurrent first callers block on the lock and then observe the single
// published instance. The system file wins conflicts; the user file only
// fills keys the system file left unset.
class DefaultConfigLoader {
public:
  explicit DefaultConfigLoader(DefaultConfigPaths paths) : paths_(std::move(paths)) {}

  DefaultConfigLoader(const DefaultConfigLoader&) = delete;
  DefaultConfigLoader& operator=(const DefaultConfigLoader&) = delete;

  const options::Values& Load();

  // Number of completed read-and-parse cycles (0 or 1).
  std::uint64_t load_count() const {
    return load_count_.load(std::memory_order_acquire);
  }

private:
  options::Values ReadAll() const;

  DefaultConfigPaths paths_;
  std::mutex mu_;
  std::unique_ptr<options::Values> storage_;
  std::atomic<const options::Values*> cached_{nullptr};
  std::atomic<std::uint64_t> load_count_{0};
};

} // namespace krep::config
