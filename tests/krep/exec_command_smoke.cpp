#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/log_capture.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using krep::tests::common::AssertContains;
using krep::tests::common::AssertEq;
using krep::tests::common::AssertTrue;
using krep::tests::common::DispatchArgs;

int main() {
  const krep::tests::common::TempDirGuard temp("krep-exec");
  const fs::path work = temp.path() / "work";
  const std::string work_flag = "--working-dir=" + work.string();

  // Runs inside the working directory; arguments are quoted for the shell.
  AssertEq(DispatchArgs({"krep", "exec", work_flag, "--", "sh", "-c", "echo 'a b' > marker.txt"}),
           0, "exec exit code");
  AssertTrue(fs::exists(work / "marker.txt"), "exec did not run in the working directory");
  AssertContains(krep::tests::common::ReadFileToString(work / "marker.txt"), "a b");

  // Tryrun only logs.
  {
    krep::tests::common::ScopedLogCapture capture;
    AssertEq(DispatchArgs({"krep", "exec", "-n", work_flag, "--", "touch", "tryrun.txt"}), 0,
             "tryrun exit code");
    AssertContains(capture.text(), "msg=\"would run\"");
    AssertContains(capture.text(), "command=\"touch tryrun.txt\"");
  }
  AssertTrue(!fs::exists(work / "tryrun.txt"), "tryrun executed the program");

  // Non-zero status is a logged domain error unless ignored.
  {
    krep::tests::common::ScopedLogCapture capture;
    AssertEq(DispatchArgs({"krep", "exec", work_flag, "false"}), 0, "failing program exit code");
    AssertContains(capture.text(), "command exited with status 1");
  }
  {
    krep::tests::common::ScopedLogCapture capture;
    AssertEq(DispatchArgs({"krep", "exec", "--ignore-status", work_flag, "false"}), 0,
             "ignored status exit code");
    AssertContains(capture.text(), "ignored non-zero exit status");
    AssertTrue(capture.text().find("level=ERROR") == std::string::npos,
               "ignored status still logged an error");
  }
  {
    krep::tests::common::ScopedLogCapture capture;
    AssertEq(DispatchArgs({"krep", "exec"}), 0, "exec without program");
    AssertContains(capture.text(), "no program given to exec");
  }

  // Flags after the program belong to the program.
  AssertEq(DispatchArgs({"krep", "exec", work_flag, "sh", "-c", "echo flags > flags.txt"}), 0,
           "program flags exit code");
  AssertContains(krep::tests::common::ReadFileToString(work / "flags.txt"), "flags");

  // env:NAME=VALUE extra options reach the program's environment.
  AssertEq(DispatchArgs({"krep", "exec", work_flag, "--extra-option=env:KREP_GREETING=hello there",
                         "--extra-option=other:ignored", "sh", "-c",
                         "echo \"$KREP_GREETING\" > env.txt"}),
           0, "extra env exit code");
  AssertContains(krep::tests::common::ReadFileToString(work / "env.txt"), "hello there");
  {
    krep::tests::common::ScopedLogCapture capture;
    AssertEq(DispatchArgs({"krep", "exec", work_flag, "--extra-option=env:1BAD=x", "true"}), 0,
             "bad env name exit code");
    AssertContains(capture.text(), "invalid environment assignment");
  }

  // pre-exec and post-exec hooks from --hook-dir run around the program.
  const fs::path hooks = temp.path() / "hooks";
  fs::create_directories(hooks);
  krep::tests::common::WriteTextFile(hooks / "pre-exec",
                                     "#!/bin/sh\necho \"pre $@\" >> hooks.log\n");
  krep::tests::common::WriteTextFile(hooks / "post-exec",
                                     "#!/bin/sh\necho \"post $@\" >> hooks.log\n");
  fs::permissions(hooks / "pre-exec", fs::perms::owner_all, fs::perm_options::add);
  fs::permissions(hooks / "post-exec", fs::perms::owner_all, fs::perm_options::add);
  const std::string hook_flag = "--hook-dir=" + hooks.string();

  AssertEq(DispatchArgs({"krep", "exec", work_flag, hook_flag, "sh", "-c",
                         "echo program >> hooks.log"}),
           0, "hooked exec exit code");
  const std::string hook_log = krep::tests::common::ReadFileToString(work / "hooks.log");
  AssertContains(hook_log, "pre sh -c echo program >> hooks.log\nprogram\npost sh -c");

  // A failing pre-exec hook stops the program.
  krep::tests::common::WriteTextFile(hooks / "pre-exec", "#!/bin/sh\nexit 4\n");
  {
    krep::tests::common::ScopedLogCapture capture;
    AssertEq(DispatchArgs({"krep", "exec", work_flag, hook_flag, "touch", "blocked.txt"}), 0,
             "failing hook exit code");
    AssertContains(capture.text(), "hook pre-exec exited with status 4");
  }
  AssertTrue(!fs::exists(work / "blocked.txt"), "program ran after a failing pre-exec hook");
  return 0;
}
