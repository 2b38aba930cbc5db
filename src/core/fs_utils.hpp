#ifndef KREP_CORE_FS_UTILS_HPP_
#define KREP_CORE_FS_UTILS_HPP_

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace krep::core {

// Joins `working_dir` and an optional `relative_dir` into an absolute,
// lexically normalized path. Nothing on disk is touched, so the result may
// name a directory that does not exist yet. An absolute `relative_dir`
// replaces `working_dir`.
inline bool ResolveAbsolutePath(std::string_view working_dir, std::string_view relative_dir,
                                std::filesystem::path& resolved, std::string& error) {
  std::filesystem::path base(working_dir.empty() ? std::string_view(".") : working_dir);
  if (!relative_dir.empty()) {
    base /= std::filesystem::path(relative_dir);
  }

  std::error_code ec;
  const std::filesystem::path absolute = std::filesystem::absolute(base, ec);
  if (ec) {
    error = "failed to resolve absolute path for '" + base.string() + "': " + ec.message();
    return false;
  }

  resolved = absolute.lexically_normal();
  // "/srv/work/." normalizes to "/srv/work/"; drop the trailing separator.
  if (!resolved.has_filename() && resolved != resolved.root_path()) {
    resolved = resolved.parent_path();
  }
  return true;
}

// Changes the process working directory for the lifetime of the guard.
//
// Enter() records the current directory, creates the target when missing and
// switches into it. The destructor (or an explicit Restore()) always switches
// back. With `remove_on_exit`, a directory that Enter() had to create is
// removed again on restore; directories that already existed are never
// removed.
class ScopedWorkingDirectory {
public:
  ScopedWorkingDirectory() = default;
  explicit ScopedWorkingDirectory(bool remove_on_exit) : remove_on_exit_(remove_on_exit) {}

  ~ScopedWorkingDirectory() {
    Restore();
  }

  ScopedWorkingDirectory(const ScopedWorkingDirectory&) = delete;
  ScopedWorkingDirectory& operator=(const ScopedWorkingDirectory&) = delete;

  bool Enter(const std::filesystem::path& target, std::string& error) {
    if (active_) {
      error = "working directory guard is already active";
      return false;
    }

    std::error_code ec;
    original_path_ = std::filesystem::current_path(ec);
    if (ec) {
      error = "failed to read current working directory: " + ec.message();
      return false;
    }

    created_ = false;
    if (!std::filesystem::exists(target, ec)) {
      std::filesystem::create_directories(target, ec);
      if (ec) {
        error = "failed to create working directory '" + target.string() + "': " + ec.message();
        return false;
      }
      created_ = true;
    }

    std::filesystem::current_path(target, ec);
    if (ec) {
      error = "failed to change working directory to '" + target.string() + "': " + ec.message();
      if (remove_on_exit_) {
        RemoveCreatedBestEffort(target);
      }
      return false;
    }

    entered_path_ = target;
    active_ = true;
    return true;
  }

  void Restore() {
    if (!active_) {
      return;
    }
    active_ = false;

    std::error_code ec;
    std::filesystem::current_path(original_path_, ec);
    if (remove_on_exit_) {
      RemoveCreatedBestEffort(entered_path_);
    }
  }

  bool active() const {
    return active_;
  }

  const std::filesystem::path& original_path() const {
    return original_path_;
  }

private:
  void RemoveCreatedBestEffort(const std::filesystem::path& path) {
    if (!created_) {
      return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    created_ = false;
  }

  std::filesystem::path original_path_;
  std::filesystem::path entered_path_;
  bool remove_on_exit_ = false;
  bool created_ = false;
  bool active_ = false;
};

} // namespace krep::core

#endif // KREP_CORE_FS_UTILS_HPP_
