#include "krep/options/option_parser.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using krep::options::OptionKind;
using krep::options::OptionList;
using krep::options::OptionParser;
using krep::options::OptionSpec;
using krep::options::OptionValue;
using krep::options::Values;

namespace {

OptionParser MakeParser() {
  OptionParser parser("krep sample [options]");
  parser.AddGroup("Sample options");
  parser.AddOption(OptionSpec{.flags = {"-w", "--working-dir"},
                              .dest = {},
                              .kind = OptionKind::kString,
                              .default_value = std::string("."),
                              .metavar = "DIR",
                              .help = "set the working directory"});
  parser.AddOption(OptionSpec{.flags = {"-n", "--tryrun"},
                              .dest = {},
                              .kind = OptionKind::kFlag,
                              .default_value = false,
                              .metavar = {},
                              .help = "dry run"});
  parser.AddOption(OptionSpec{.flags = {"-v", "--verbose"},
                              .dest = {},
                              .kind = OptionKind::kCount,
                              .default_value = -1,
                              .metavar = {},
                              .help = "more output"});
  parser.AddOption(OptionSpec{.flags = {"-f", "--file"},
                              .dest = "batch_file",
                              .kind = OptionKind::kAppend,
                              .default_value = {},
                              .metavar = "FILE",
                              .help = "batch file"});
  parser.AddOption(OptionSpec{.flags = {"--jobs"},
                              .dest = {},
                              .kind = OptionKind::kInt,
                              .default_value = 1,
                              .metavar = {},
                              .help = "parallel jobs"});
  return parser;
}

} // namespace

TEST_CASE("SeedDefaults holds every declared option as not explicit", "[options][parser]") {
  const OptionParser parser = MakeParser();
  const Values values = parser.SeedDefaults();

  REQUIRE(values.GetString("working_dir") == ".");
  REQUIRE(values.GetInt("verbose") == -1);
  REQUIRE(values.GetList("batch_file").empty());
  REQUIRE_FALSE(values.IsExplicit("working_dir"));
  REQUIRE(values.size() == 5U);
}

TEST_CASE("Parse handles long, short, clustered and positional tokens", "[options][parser]") {
  const OptionParser parser = MakeParser();
  Values values = parser.SeedDefaults();
  std::vector<std::string> positionals;
  std::string error;

  REQUIRE(parser.Parse({"-nvv", "--working-dir=/srv", "first", "-f", "a.conf", "--file",
                        "b.conf", "--jobs", "3", "--", "--not-a-flag"},
                       values, positionals, error));
  REQUIRE(values.GetBool("tryrun"));
  REQUIRE(values.GetInt("verbose") == 2);
  REQUIRE(values.GetString("working_dir") == "/srv");
  REQUIRE(values.GetList("batch_file") == OptionList{"a.conf", "b.conf"});
  REQUIRE(values.GetInt("jobs") == 3);
  REQUIRE(positionals == std::vector<std::string>{"first", "--not-a-flag"});
}

TEST_CASE("Short options accept attached values", "[options][parser]") {
  const OptionParser parser = MakeParser();
  Values values = parser.SeedDefaults();
  std::vector<std::string> positionals;
  std::string error;

  REQUIRE(parser.Parse({"-w/opt/work"}, values, positionals, error));
  REQUIRE(values.GetString("working_dir") == "/opt/work");
}

TEST_CASE("First positional ends parsing when interspersed args are off", "[options][parser]") {
  OptionParser parser = MakeParser();
  parser.DisableInterspersedArgs();
  Values values = parser.SeedDefaults();
  std::vector<std::string> positionals;
  std::string error;

  REQUIRE(parser.Parse({"-n", "ls", "-la", "--jobs", "3"}, values, positionals, error));
  REQUIRE(values.GetBool("tryrun"));
  REQUIRE(values.GetInt("jobs") == 1);
  REQUIRE_FALSE(values.IsExplicit("jobs"));
  REQUIRE(positionals == std::vector<std::string>{"ls", "-la", "--jobs", "3"});
}

TEST_CASE("Parse rejects malformed input", "[options][parser]") {
  const OptionParser parser = MakeParser();
  std::vector<std::string> positionals;
  std::string error;

  Values values = parser.SeedDefaults();
  REQUIRE_FALSE(parser.Parse({"--bogus"}, values, positionals, error));
  REQUIRE(error == "no such option: --bogus");

  values = parser.SeedDefaults();
  REQUIRE_FALSE(parser.Parse({"--jobs", "many"}, values, positionals, error));
  REQUIRE(error.find("invalid integer value") != std::string::npos);

  values = parser.SeedDefaults();
  REQUIRE_FALSE(parser.Parse({"--working-dir"}, values, positionals, error));
  REQUIRE(error.find("requires an argument") != std::string::npos);

  values = parser.SeedDefaults();
  REQUIRE_FALSE(parser.Parse({"--tryrun=yes"}, values, positionals, error));
  REQUIRE(error.find("does not take a value") != std::string::npos);
}

TEST_CASE("Duplicate flags are reported as declaration errors", "[options][parser]") {
  OptionParser parser = MakeParser();
  std::string error;
  REQUIRE_FALSE(parser.DeclarationError(error));

  parser.AddOption(OptionSpec{.flags = {"-f", "--force"},
                              .dest = {},
                              .kind = OptionKind::kFlag,
                              .default_value = false,
                              .metavar = {},
                              .help = {}});
  REQUIRE(parser.DeclarationError(error));
  REQUIRE(error == "conflicting option string: -f");
  REQUIRE_FALSE(parser.Declares("force"));
}

TEST_CASE("ParseInjected accepts inline values for flags and counters", "[options][parser]") {
  const OptionParser parser = MakeParser();
  std::string dest;
  OptionValue value;
  std::string error;

  REQUIRE(parser.ParseInjected("--tryrun=false", dest, value, error));
  REQUIRE(dest == "tryrun");
  REQUIRE(std::get<bool>(value) == false);

  REQUIRE(parser.ParseInjected("--verbose=2", dest, value, error));
  REQUIRE(std::get<int>(value) == 2);

  REQUIRE(parser.ParseInjected("--file=x.conf", dest, value, error));
  REQUIRE(dest == "batch_file");
  REQUIRE(std::get<OptionList>(value) == OptionList{"x.conf"});

  REQUIRE_FALSE(parser.ParseInjected("--working-dir", dest, value, error));
  REQUIRE_FALSE(parser.ParseInjected("--unknown=1", dest, value, error));
  REQUIRE_FALSE(parser.ParseInjected("tryrun", dest, value, error));
}

TEST_CASE("CoerceValue converts config strings to declared kinds", "[options][parser]") {
  const OptionParser parser = MakeParser();
  OptionValue value;
  std::string error;

  REQUIRE(OptionParser::CoerceValue(*parser.FindByDest("tryrun"), std::string("Yes"), value,
                                    error));
  REQUIRE(std::get<bool>(value));

  REQUIRE(OptionParser::CoerceValue(*parser.FindByDest("jobs"), OptionList{"2", "5"}, value,
                                    error));
  REQUIRE(std::get<int>(value) == 5);

  REQUIRE(OptionParser::CoerceValue(*parser.FindByDest("batch_file"), std::string("one"), value,
                                    error));
  REQUIRE(std::get<OptionList>(value) == OptionList{"one"});

  REQUIRE_FALSE(OptionParser::CoerceValue(*parser.FindByDest("tryrun"), std::string("maybe"),
                                          value, error));
}

TEST_CASE("FormatHelp lists groups and flags", "[options][parser]") {
  const std::string help = MakeParser().FormatHelp();

  REQUIRE(help.rfind("usage: krep sample [options]", 0) == 0);
  REQUIRE(help.find("Sample options:") != std::string::npos);
  REQUIRE(help.find("-w DIR, --working-dir=DIR") != std::string::npos);
  REQUIRE(help.find("--jobs=JOBS") != std::string::npos);
}
