/***
 * Name: test_environment_stager
 * Purpose: Validate staging: extraction, activation append, and fixup reporting and cleanup.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>
#include "floability/cleanup/registry.h"
#include "floability/exceptions/extraction_error.h"
#include "floability/exceptions/fixup_error.h"
#include "floability/exceptions/path_traversal_error.h"
#include "floability/stages/environment_stager.h"
#include "util/TarBuilder.h"
#include "util/TempDir.h"

namespace fs = std::filesystem;
using floability::stages::EnvironmentStager;
using floability::stages::StagerConfig;

namespace {

StagerConfig NoFixup() {
  StagerConfig c;
  c.fixup_command.clear();
  return c;
}

constexpr const char* kScript = "/etc/conda/activate.d/env_vars.sh";

bool WaitFor(const std::function<bool()>& pred) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return pred();
}

}  // namespace

TEST(EnvironmentStager, AppendsIdentityToExistingScript) {
  testutil::TempDir tmp("floability_stager");
  fs::create_directories(tmp / "env/etc/conda/activate.d");
  testutil::WriteBytes(tmp / "env/etc/conda/activate.d/env_vars.sh", "export PRIOR=1");
  EnvironmentStager stager(NoFixup());
  stager.WriteActivation(tmp / "env", "test-mgr");
  EXPECT_EQ(testutil::ReadBytes(tmp.path() + "/env" + kScript), "export PRIOR=1\nexport VINE_MANAGER_NAME=test-mgr\n");
}

TEST(EnvironmentStager, CreatesScriptAndParents) {
  testutil::TempDir tmp("floability_stager");
  fs::create_directories(tmp / "env");
  EnvironmentStager stager(NoFixup());
  stager.WriteActivation(tmp / "env", "floability-abc");
  const auto text = testutil::ReadBytes(tmp.path() + "/env" + kScript);
  EXPECT_NE(text.find("export VINE_MANAGER_NAME=floability-abc\n"), std::string::npos);
}

TEST(EnvironmentStager, CustomIdentityVariable) {
  testutil::TempDir tmp("floability_stager");
  fs::create_directories(tmp / "env");
  StagerConfig c = NoFixup();
  c.identity_variable = "MY_MANAGER";
  c.activation_script = "activate.sh";
  EnvironmentStager(c).WriteActivation(tmp / "env", "m1");
  EXPECT_EQ(testutil::ReadBytes(tmp / "env/activate.sh"), "\nexport MY_MANAGER=m1\n");
}

TEST(EnvironmentStager, ActivationThroughEscapingLinkRejected) {
  testutil::TempDir tmp("floability_stager");
  fs::create_directories(tmp / "env");
  fs::create_directories(tmp / "outside");
  fs::create_directory_symlink(tmp / "outside", tmp / "env/etc");
  EXPECT_THROW(EnvironmentStager(NoFixup()).WriteActivation(tmp / "env", "test-mgr"),
               floability::exceptions::PathTraversalError);
  EXPECT_FALSE(fs::exists(tmp / "outside/conda"));
}

TEST(EnvironmentStager, ActivationScriptLinkedInsideIsFollowed) {
  testutil::TempDir tmp("floability_stager");
  fs::create_directories(tmp / "env/etc/conda/activate.d");
  fs::create_directories(tmp / "env/share");
  testutil::WriteBytes(tmp / "env/share/vars.sh", "export B=2");
  fs::create_symlink("../../../share/vars.sh", tmp / "env/etc/conda/activate.d/env_vars.sh");
  EnvironmentStager(NoFixup()).WriteActivation(tmp / "env", "test-mgr");
  EXPECT_EQ(testutil::ReadBytes(tmp / "env/share/vars.sh"), "export B=2\nexport VINE_MANAGER_NAME=test-mgr\n");
}

TEST(EnvironmentStager, ActivationDanglingLinkNotFollowed) {
  testutil::TempDir tmp("floability_stager");
  fs::create_directories(tmp / "env/etc/conda/activate.d");
  fs::create_symlink(tmp / "planted.sh", tmp / "env/etc/conda/activate.d/env_vars.sh");
  EXPECT_ANY_THROW(EnvironmentStager(NoFixup()).WriteActivation(tmp / "env", "test-mgr"));
  EXPECT_FALSE(fs::exists(tmp / "planted.sh"));
}

TEST(EnvironmentStager, StageExtractsWritesAndRunsFixup) {
  testutil::TempDir tmp("floability_stager");
  fs::create_directories(tmp / "env");
  testutil::WriteBytes(tmp / "env.tar.gz",
                       testutil::Gzip(testutil::TarBuilder()
                                          .File("bin/python", "py", 0755)
                                          .File("etc/conda/activate.d/env_vars.sh", "export A=1\n")
                                          .Build()));
  StagerConfig c;
  c.fixup_command = {"sh", "-c", "touch fixed && test \"$(pwd -P)\" = \"$(cd {prefix} && pwd -P)\""};
  EnvironmentStager(c).Stage(tmp / "env.tar.gz", tmp / "env", "test-mgr");
  EXPECT_EQ(testutil::ReadBytes(tmp / "env/bin/python"), "py");
  EXPECT_EQ(testutil::ReadBytes(tmp.path() + "/env" + kScript), "export A=1\n\nexport VINE_MANAGER_NAME=test-mgr\n");
  EXPECT_TRUE(fs::exists(tmp / "env/fixed"));
}

TEST(EnvironmentStager, FixupFailureCarriesOutput) {
  testutil::TempDir tmp("floability_stager");
  fs::create_directories(tmp / "env");
  StagerConfig c;
  c.fixup_command = {"sh", "-c", "echo relocation failed for {prefix} >&2; exit 3"};
  EnvironmentStager stager(c);
  try {
    stager.RunFixup(tmp / "env");
    FAIL() << "expected FixupError";
  } catch (const floability::exceptions::FixupError& e) {
    EXPECT_EQ(e.exit_code(), 3);
    EXPECT_NE(e.output().find("relocation failed for " + tmp / "env"), std::string::npos);
  }
}

TEST(EnvironmentStager, CleanupDuringFixupStopsItBeforeRemovingDirectory) {
  testutil::TempDir tmp("floability_stager");
  fs::create_directories(tmp / "env");
  floability::cleanup::CleanupRegistry registry(std::chrono::milliseconds(2000));
  registry.RegisterDirectory(tmp / "env");
  const std::string pid_file = tmp / "fixup.pid";
  StagerConfig c;
  c.fixup_command = {"sh", "-c", "echo $$ > " + pid_file + "; sleep 30; touch {prefix}/late"};
  EnvironmentStager stager(c, registry);

  std::string failure;
  std::thread runner([&] {
    try {
      stager.RunFixup(tmp / "env");
    } catch (const floability::exceptions::FixupError& e) {
      failure = e.what();
    }
  });
  const bool running = WaitFor([&] {
    return registry.process_count() == 1 && testutil::ReadBytes(pid_file).find('\n') != std::string::npos;
  });
  const auto report = registry.Cleanup();
  runner.join();

  ASSERT_TRUE(running);
  EXPECT_TRUE(report.performed);
  EXPECT_EQ(report.processes_terminated, 1u);
  EXPECT_TRUE(report.ok());
  EXPECT_FALSE(fs::exists(tmp / "env"));
  EXPECT_NE(failure.find("interrupted"), std::string::npos);
  const pid_t pid = std::stoi(testutil::ReadBytes(pid_file));
  EXPECT_NE(::kill(pid, 0), 0);
}

TEST(EnvironmentStager, FixupRegisteredAndReapedOnSuccess) {
  testutil::TempDir tmp("floability_stager");
  fs::create_directories(tmp / "env");
  floability::cleanup::CleanupRegistry registry;
  StagerConfig c;
  c.fixup_command = {"sh", "-c", "echo relocated"};
  EnvironmentStager(c, registry).RunFixup(tmp / "env");
  EXPECT_EQ(registry.process_count(), 1u);
  const auto report = registry.Cleanup();
  EXPECT_TRUE(report.ok());
}

TEST(EnvironmentStager, FixupToolMissing) {
  testutil::TempDir tmp("floability_stager");
  fs::create_directories(tmp / "env");
  StagerConfig c;
  c.fixup_command = {"floability-no-such-fixup-tool"};
  EXPECT_THROW(EnvironmentStager(c).RunFixup(tmp / "env"), floability::exceptions::FixupError);
}

TEST(EnvironmentStager, UnsafeArchiveStopsBeforeActivation) {
  testutil::TempDir tmp("floability_stager");
  fs::create_directories(tmp / "env");
  testutil::WriteBytes(tmp / "bad.tar", testutil::TarBuilder().File("../escape", "x").Build());
  EXPECT_THROW(EnvironmentStager(NoFixup()).Stage(tmp / "bad.tar", tmp / "env", "m"),
               floability::exceptions::PathTraversalError);
  EXPECT_FALSE(fs::exists(tmp.path() + "/env" + kScript));
  EXPECT_FALSE(fs::exists(tmp / "escape"));
}

TEST(EnvironmentStager, EmptyArchiveIsExtractionError) {
  testutil::TempDir tmp("floability_stager");
  fs::create_directories(tmp / "env");
  testutil::WriteBytes(tmp / "empty.tar.gz", "");
  EXPECT_THROW(EnvironmentStager(NoFixup()).Stage(tmp / "empty.tar.gz", tmp / "env", "m"),
               floability::exceptions::ExtractionError);
}
