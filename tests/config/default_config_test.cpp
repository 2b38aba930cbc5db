#include "common/temp_dir.hpp"
#include "krep/config/default_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using krep::config::DefaultConfigLoader;
using krep::config::DefaultConfigPaths;

TEST_CASE("Load reads both files and the system file wins", "[config][defaults]") {
  const krep::tests::common::TempDirGuard temp("krep-default-config");
  const auto system_path = temp.path() / "krepconfig";
  const auto user_path = temp.path() / ".krepconfig";
  krep::tests::common::WriteTextFile(system_path, "tryrun = true\nworking-dir = /from/system\n");
  krep::tests::common::WriteTextFile(user_path,
                                     "working-dir = /from/user\nrelative-dir = sub\n");

  DefaultConfigLoader loader(DefaultConfigPaths{.system_path = system_path,
                                                .user_path = user_path});
  const auto& values = loader.Load();

  REQUIRE(values.GetString("working_dir") == "/from/system");
  REQUIRE(values.GetString("relative_dir") == "sub");
  REQUIRE(values.GetString("tryrun") == "true");
  REQUIRE(loader.load_count() == 1U);
}

TEST_CASE("Missing and malformed files contribute nothing", "[config][defaults]") {
  const krep::tests::common::TempDirGuard temp("krep-default-config");
  const auto broken = temp.path() / "broken";
  krep::tests::common::WriteTextFile(broken, "not a config line\n");

  DefaultConfigLoader loader(DefaultConfigPaths{.system_path = temp.path() / "absent",
                                                .user_path = broken});
  REQUIRE(loader.Load().empty());
  REQUIRE(loader.load_count() == 1U);
}

TEST_CASE("Concurrent first callers observe one instance", "[config][defaults]") {
  const krep::tests::common::TempDirGuard temp("krep-default-config");
  const auto system_path = temp.path() / "krepconfig";
  krep::tests::common::WriteTextFile(system_path, "force = yes\n");

  DefaultConfigLoader loader(DefaultConfigPaths{.system_path = system_path, .user_path = {}});

  constexpr int kThreads = 8;
  std::vector<const krep::options::Values*> seen(kThreads, nullptr);
  std::atomic<bool> start{false};
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      while (!start.load()) {
        std::this_thread::yield();
      }
      seen[static_cast<std::size_t>(i)] = &loader.Load();
    });
  }
  start.store(true);
  for (auto& thread : threads) {
    thread.join();
  }

  for (const auto* values : seen) {
    REQUIRE(values == seen.front());
  }
  REQUIRE(&loader.Load() == seen.front());
  REQUIRE(seen.front()->GetBool("force"));
  REQUIRE(loader.load_count() == 1U);
}
