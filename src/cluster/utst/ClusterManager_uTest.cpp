/**
 * @file ClusterManager_uTest.cpp
 * @brief Unit tests for kindling::cluster::ClusterManager.
 *
 * Notes:
 *  - kind and docker are scripted through FakeCommandRunner.
 *  - Installs go to a per-test temporary directory.
 */

#include "src/cluster/inc/ClusterManager.hpp"
#include "src/common/inc/Log.hpp"
#include "src/exec/utst/FakeCommandRunner.hpp"
#include "src/kube/utst/FakeKubeClient.hpp"
#include "src/net/utst/FakeNet.hpp"

#include <gtest/gtest.h>

#include <stdlib.h> // mkdtemp

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using kindling::cluster::ClusterDescriptor;
using kindling::cluster::ClusterManager;
using kindling::cluster::ClusterOptions;
using kindling::common::ErrorKind;
using kindling::common::makeNullLogger;
using kindling::common::Status;
using kindling::exec::CmdResult;
using kindling::exec::testing::FakeCommandRunner;
using kindling::exec::testing::RecordingSleeper;
using kindling::kube::NodeInfo;
using kindling::kube::testing::FakeKubeClient;
using kindling::naming::validateName;
using kindling::net::testing::FakeHttpClient;
using kindling::platform::HostInfo;
using kindling::platform::Platform;
using kindling::readiness::ReadinessChecks;

namespace {

/// Reads the --config file while it still exists.
class ConfigCapturingRunner final : public kindling::exec::CommandRunner {
public:
  using CommandRunner::run;

  CmdResult run(const kindling::exec::CommandLine& cmd,
                std::chrono::milliseconds /*timeout*/) override {
    std::ifstream in(cmd.argv().back());
    config.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return CmdResult::success("");
  }

  std::string config;
};

} // namespace

class ClusterManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    char tmpl[] = "/tmp/kindling-bin-XXXXXX";
    ASSERT_NE(::mkdtemp(tmpl), nullptr);
    binDir_ = tmpl;
    options_.installDirs = {binDir_};
    runner_.on("kind version", CmdResult::success("kind v0.20.0 go1.20.4 linux/amd64"));
    runner_.on("kind get clusters", CmdResult::success(""));
    runner_.on("kind create cluster", CmdResult::success(""));
    runner_.on("kind export kubeconfig", CmdResult::success(""));
    runner_.on("docker network ls", CmdResult::success("kind\n"));
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(binDir_, ec);
  }

  ClusterManager manager(HostInfo host = HostInfo{"Linux", "x86_64"}) {
    return ClusterManager(runner_, http_, sleeper_, kube_, host, makeNullLogger(), options_);
  }

  ClusterDescriptor descriptor(bool strict = true) {
    return ClusterDescriptor{*validateName("kindling").name, strict};
  }

  FakeCommandRunner runner_;
  FakeHttpClient http_;
  RecordingSleeper sleeper_;
  FakeKubeClient kube_;
  ClusterOptions options_;
  ReadinessChecks checks_;
  std::vector<std::string> warnings_;
  std::string binDir_;
};

/* ----------------------------- Create ----------------------------- */

/** @test Missing cluster is created, waited for and exported. */
TEST_F(ClusterManagerTest, CreatesMissingCluster) {
  auto mgr = manager();
  ASSERT_TRUE(mgr.ensure(descriptor(), 6001, Platform::LINUX_AMD64, checks_, warnings_).ok());

  EXPECT_EQ(runner_.count("kind create cluster --name kindling --config "), 1U);
  EXPECT_EQ(runner_.count("kind export kubeconfig --name kindling"), 1U);
  EXPECT_EQ(checks_.toolInstalled, true);
  EXPECT_EQ(checks_.clusterCreated, true);
  ASSERT_FALSE(sleeper_.delays().empty());
  EXPECT_EQ(sleeper_.delays().front(), std::chrono::milliseconds(5000));
  EXPECT_TRUE(warnings_.empty());
}

/** @test Generated config file is removed after creation. */
TEST_F(ClusterManagerTest, ConfigFileRemoved) {
  auto mgr = manager();
  ASSERT_TRUE(mgr.createCluster(descriptor(), 6001, Platform::LINUX_AMD64).ok());
  const std::string& LINE = runner_.calls().back();
  const std::string PATH = LINE.substr(LINE.rfind(' ') + 1);
  EXPECT_FALSE(std::filesystem::exists(PATH));
}

/** @test Existing cluster is not recreated. */
TEST_F(ClusterManagerTest, ReusesExistingCluster) {
  runner_.on("kind get clusters", CmdResult::success("other\nkindling\n"));
  auto mgr = manager();
  ASSERT_TRUE(mgr.ensure(descriptor(), 6001, Platform::LINUX_AMD64, checks_, warnings_).ok());
  EXPECT_EQ(runner_.count("kind create cluster"), 0U);
  EXPECT_TRUE(sleeper_.delays().empty());
  EXPECT_EQ(checks_.clusterCreated, true);
}

/** @test Creation failure is a provisioning failure with kind's stderr. */
TEST_F(ClusterManagerTest, CreateFailure) {
  runner_.on("kind create cluster",
             CmdResult::failure("ERROR: failed to create cluster: node(s) already exist"));
  auto mgr = manager();
  const Status S = mgr.ensure(descriptor(), 6001, Platform::LINUX_AMD64, checks_, warnings_);
  EXPECT_EQ(S.kind, ErrorKind::PROVISIONING);
  EXPECT_NE(S.guidance.hint.find("already exist"), std::string::npos);
  EXPECT_FALSE(checks_.clusterCreated.has_value());
  EXPECT_EQ(runner_.count("kind export"), 0U);
}

/** @test Missing network after creation is polled then only logged. */
TEST_F(ClusterManagerTest, NetworkWaitIsBounded) {
  runner_.on("docker network ls", CmdResult::success(""));
  auto mgr = manager();
  ASSERT_TRUE(mgr.ensure(descriptor(), 6001, Platform::LINUX_AMD64, checks_, warnings_).ok());
  EXPECT_EQ(runner_.count("docker network ls"), 10U);
  // stabilization + 9 gaps between polls
  EXPECT_EQ(sleeper_.delays().size(), 10U);
}

/** @test Export failure is a warning. */
TEST_F(ClusterManagerTest, ExportFailureWarns) {
  runner_.on("kind export kubeconfig", CmdResult::failure("no nodes found"));
  auto mgr = manager();
  ASSERT_TRUE(mgr.ensure(descriptor(), 6001, Platform::LINUX_AMD64, checks_, warnings_).ok());
  ASSERT_EQ(warnings_.size(), 1U);
  EXPECT_NE(warnings_[0].find("kubeconfig"), std::string::npos);
}

/* ----------------------------- Install ----------------------------- */

/** @test Missing kind is downloaded for this host and placed on the first writable dir. */
TEST_F(ClusterManagerTest, InstallsKind) {
  runner_.onSequence("kind version", {CmdResult::failure("", 127), CmdResult::success("kind")});
  auto mgr = manager(HostInfo{"Darwin", "arm64"});
  ASSERT_TRUE(mgr.ensure(descriptor(), 6001, Platform::LINUX_AMD64, checks_, warnings_).ok());

  ASSERT_EQ(http_.downloads.size(), 1U);
  EXPECT_EQ(http_.downloads[0].rfind("https://kind.sigs.k8s.io/dl/v0.20.0/kind-darwin-arm64", 0),
            0U);
  EXPECT_TRUE(std::filesystem::exists(binDir_ + "/kind"));
  EXPECT_EQ(checks_.toolInstalled, true);
}

/** @test Failed install warns, and a still-missing tool is fatal. */
TEST_F(ClusterManagerTest, InstallFailure) {
  runner_.on("kind version", CmdResult::failure("", 127));
  http_.downloadOk = false;
  auto mgr = manager();
  const Status S = mgr.ensure(descriptor(), 6001, Platform::LINUX_AMD64, checks_, warnings_);
  EXPECT_EQ(S.kind, ErrorKind::PROVISIONING);
  EXPECT_EQ(checks_.toolInstalled, false);
  ASSERT_EQ(warnings_.size(), 1U);
  EXPECT_NE(warnings_[0].find("Failed to download kind"), std::string::npos);
  EXPECT_EQ(runner_.count("kind get clusters"), 0U);
}

/* ----------------------------- Node Image ----------------------------- */

/** @test Lenient amd64 target on an arm64 host pins the amd64 node image. */
TEST_F(ClusterManagerTest, PinsAmd64ImageWhenLenient) {
  ConfigCapturingRunner capture;
  ClusterManager mgr(capture, http_, sleeper_, kube_, HostInfo{"Darwin", "arm64"},
                     makeNullLogger(), options_);

  ASSERT_TRUE(mgr.createCluster(descriptor(false), 6001, Platform::LINUX_AMD64).ok());
  EXPECT_NE(capture.config.find("kindest/node:v1.27.3@sha256:"), std::string::npos);

  ASSERT_TRUE(mgr.createCluster(descriptor(true), 6001, Platform::LINUX_AMD64).ok());
  EXPECT_EQ(capture.config.find("kindest/node"), std::string::npos);
  EXPECT_NE(capture.config.find("localhost:6001"), std::string::npos);
}

/* ----------------------------- Drift ----------------------------- */

/** @test Strict drift on an existing cluster names the delete command. */
TEST_F(ClusterManagerTest, StrictDrift) {
  runner_.on("kind get clusters", CmdResult::success("kindling\n"));
  kube_.node = NodeInfo{"arm64", "linux"};
  auto mgr = manager();
  const Status S = mgr.ensure(descriptor(true), 6001, Platform::LINUX_AMD64, checks_, warnings_);
  EXPECT_EQ(S.kind, ErrorKind::PLATFORM_MISMATCH);
  EXPECT_NE(S.guidance.resolution.find("kind delete cluster --name kindling"), std::string::npos);
}

/** @test Existing cluster's kubeconfig is exported before its nodes are read. */
TEST_F(ClusterManagerTest, ExportsBeforeDriftCheck) {
  runner_.on("kind get clusters", CmdResult::success("kindling\n"));
  kube_.node = NodeInfo{"arm64", "linux"};
  std::size_t exportsSeen = 0;
  kube_.onNodeQuery = [&] {
    exportsSeen = runner_.count("kind export kubeconfig --name kindling");
  };
  auto mgr = manager();
  const Status S = mgr.ensure(descriptor(true), 6001, Platform::LINUX_AMD64, checks_, warnings_);
  EXPECT_EQ(S.kind, ErrorKind::PLATFORM_MISMATCH);
  EXPECT_EQ(exportsSeen, 1U);
  EXPECT_FALSE(checks_.clusterCreated.value_or(false));
}

/** @test Undetectable platform is fatal in strict mode only. */
TEST_F(ClusterManagerTest, DriftDetectionFailure) {
  runner_.on("kind get clusters", CmdResult::success("kindling\n"));
  kube_.node.reset();
  auto mgr = manager();
  EXPECT_EQ(mgr.checkExistingPlatform(descriptor(true), Platform::LINUX_AMD64).kind,
            ErrorKind::PLATFORM_MISMATCH);
  EXPECT_TRUE(mgr.checkExistingPlatform(descriptor(false), Platform::LINUX_AMD64).ok());
}
