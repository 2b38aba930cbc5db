#ifndef KREP_TESTS_COMMON_CLI_DISPATCH_HPP_
#define KREP_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "krep/cli/router.hpp"
#include "krep/config/default_config.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace krep::tests::common {

// Runs the full entry point with a loader the test controls, so no real
// /etc or $HOME configuration leaks in. argv_storage[0] is the program name.
inline int DispatchArgs(const std::vector<std::string>& argv_storage,
                        const config::DefaultConfigPaths& paths = {}) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  config::DefaultConfigLoader loader(paths);
  return krep::cli::Dispatch(static_cast<int>(argv.size()), argv.data(), loader);
}

inline int DispatchWithCapturedStdout(const std::vector<std::string>& argv_storage,
                                      std::string& stdout_text,
                                      const config::DefaultConfigPaths& paths = {}) {
  std::ostringstream captured;
  std::streambuf* original = std::cout.rdbuf(captured.rdbuf());
  const int exit_code = DispatchArgs(argv_storage, paths);
  std::cout.rdbuf(original);
  stdout_text = captured.str();
  return exit_code;
}

} // namespace krep::tests::common

#endif // KREP_TESTS_COMMON_CLI_DISPATCH_HPP_
