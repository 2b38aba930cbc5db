#include "common/test_commands.hpp"
#include "krep/commands/builtin_commands.hpp"
#include "krep/commands/registry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

using krep::commands::CommandRegistry;
using krep::tests::common::RecordingCommand;
using krep::tests::common::CallRecord;

namespace {

// Declares `-n`, which the global --tryrun flag already owns.
class ClashingCommand final : public krep::commands::ICommand {
public:
  std::string Name() const override {
    return "clash";
  }
  std::string Summary() const override {
    return "clashes with the global flags";
  }
  void DeclareOptions(krep::options::OptionParser& parser) const override {
    parser.AddOption(krep::options::OptionSpec{.flags = {"-n", "--name"},
                                               .dest = "name",
                                               .kind = krep::options::OptionKind::kString,
                                               .default_value = {},
                                               .metavar = {},
                                               .help = {}});
  }
  krep::commands::CommandResult Execute(const krep::options::Values&,
                                        const std::vector<std::string>&,
                                        krep::commands::CommandContext&) const override {
    return krep::commands::CommandResult::Ok();
  }
};

} // namespace

TEST_CASE("Registry finds registered commands by name", "[commands][registry]") {
  CommandRegistry registry;
  std::string error;
  REQUIRE(registry.Register(
      std::make_unique<RecordingCommand>("zeta", std::make_shared<CallRecord>()), error));
  REQUIRE(registry.Register(
      std::make_unique<RecordingCommand>("alpha", std::make_shared<CallRecord>()), error));

  REQUIRE(registry.size() == 2U);
  REQUIRE(registry.Find("alpha") != nullptr);
  REQUIRE(registry.Find("alpha")->Name() == "alpha");
  REQUIRE(registry.Find("frobnicate") == nullptr);
  REQUIRE(registry.Names() == std::vector<std::string>{"alpha", "zeta"});
}

TEST_CASE("Registry rejects duplicates, null and clashing commands", "[commands][registry]") {
  CommandRegistry registry;
  std::string error;
  REQUIRE(registry.Register(
      std::make_unique<RecordingCommand>("recorder", std::make_shared<CallRecord>()), error));

  REQUIRE_FALSE(registry.Register(
      std::make_unique<RecordingCommand>("recorder", std::make_shared<CallRecord>()), error));
  REQUIRE(error == "sub-command 'recorder' is already registered");

  REQUIRE_FALSE(registry.Register(nullptr, error));

  REQUIRE_FALSE(registry.Register(std::make_unique<ClashingCommand>(), error));
  REQUIRE(error.find("conflicting option string: -n") != std::string::npos);
  REQUIRE(registry.size() == 1U);
}

TEST_CASE("Built-in commands register cleanly", "[commands][registry]") {
  CommandRegistry registry;
  std::string error;
  REQUIRE(krep::commands::RegisterBuiltinCommands(registry, error));
  REQUIRE(registry.Names() == std::vector<std::string>{"batch", "exec", "help", "version"});
  REQUIRE(registry.Find("batch")->SupportInject());
  REQUIRE_FALSE(registry.Find("version")->SupportInject());
}

TEST_CASE("Result kinds have stable names", "[commands]") {
  using Kind = krep::commands::CommandResult::Kind;
  REQUIRE(std::string(krep::commands::ToString(Kind::kOk)) == "ok");
  REQUIRE(std::string(krep::commands::ToString(Kind::kDomainError)) == "domain_error");
  REQUIRE(std::string(krep::commands::ToString(Kind::kUnexpectedError)) == "unexpected_error");
}
