/**
 * @file Orchestrator_uTest.cpp
 * @brief End-to-end tests for kindling::prepare::Orchestrator.
 *
 * Notes:
 *  - docker, kind and kubectl run are modelled by SimulatedHost, so state
 *    carries over between prepare() calls on the same fixture.
 *  - Cluster API queries go to FakeKubeClient.
 */

#include "src/common/inc/Log.hpp"
#include "src/exec/utst/FakeCommandRunner.hpp"
#include "src/kube/utst/FakeKubeClient.hpp"
#include "src/net/utst/FakeNet.hpp"
#include "src/prepare/inc/Orchestrator.hpp"
#include "src/prepare/utst/SimulatedHost.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using kindling::common::ErrorKind;
using kindling::common::makeNullLogger;
using kindling::exec::testing::RecordingSleeper;
using kindling::kube::NodeInfo;
using kindling::kube::testing::FakeKubeClient;
using kindling::net::testing::FakeHttpClient;
using kindling::net::testing::FakePortScanner;
using kindling::platform::HostInfo;
using kindling::platform::Platform;
using kindling::prepare::Environment;
using kindling::prepare::Orchestrator;
using kindling::prepare::PrepareConfig;
using kindling::prepare::PrepareOutcome;
using kindling::prepare::PrepareRequest;
using kindling::prepare::testing::SimulatedHost;
using kindling::registry::RegistryPhase;

class OrchestratorTest : public ::testing::Test {
protected:
  SimulatedHost host_;
  FakeHttpClient http_;
  RecordingSleeper sleeper_;
  FakePortScanner ports_;
  FakeKubeClient kube_;
  PrepareConfig config_;

  PrepareOutcome prepare(const PrepareRequest& request = {}) {
    Orchestrator orchestrator(host_, http_, sleeper_, ports_, kube_, HostInfo{"Linux", "x86_64"},
                              makeNullLogger(), config_);
    return orchestrator.prepare(request);
  }

  static bool anyWarning(const PrepareOutcome& out, const std::string& a, const std::string& b) {
    const auto& W = out.report.warnings;
    return std::any_of(W.begin(), W.end(), [&](const std::string& w) {
      return w.find(a) != std::string::npos && w.find(b) != std::string::npos;
    });
  }
};

/** @test Fresh development host ends with a validated registry and a ready cluster. */
TEST_F(OrchestratorTest, DevelopmentFromScratch) {
  const PrepareOutcome OUT = prepare();

  ASSERT_TRUE(OUT.status.ok()) << OUT.status.toString();
  const auto& R = OUT.report;
  EXPECT_TRUE(R.ready);
  EXPECT_EQ(R.cluster, "kindling");
  EXPECT_EQ(R.ns, "default");
  EXPECT_TRUE(R.warnings.empty());

  ASSERT_TRUE(R.localRegistry.has_value());
  EXPECT_EQ(R.localRegistry->hostPort, 6000);
  EXPECT_FALSE(R.localRegistry->reused);
  EXPECT_TRUE(R.localRegistry->healthy());
  EXPECT_TRUE(R.localRegistry->networkConnected);
  EXPECT_EQ(R.localRegistry->networkAddress, "172.18.0.3");
  EXPECT_EQ(R.localRegistry->resolvedAddress, "172.18.0.3");
  EXPECT_EQ(R.localRegistry->phase, RegistryPhase::VALIDATED);

  ASSERT_EQ(host_.clusters.count("kindling"), 1U);
  EXPECT_NE(host_.clusters.at("kindling").containerdConfig.find("\"localhost:6000\""),
            std::string::npos);
  EXPECT_TRUE(host_.clusters.at("kindling").nodeImage.empty());

  EXPECT_EQ(R.checks.registryCreated, true);
  EXPECT_EQ(R.checks.clusterCreated, true);
  EXPECT_EQ(R.checks.toolInstalled, true);
  EXPECT_EQ(R.checks.platformCompatible, true);
  ASSERT_TRUE(R.platformVerdict.has_value());
  EXPECT_TRUE(R.platformVerdict->verified);
  EXPECT_EQ(kube_.applied.size(), 1U); // local-registry-hosting
}

/** @test A second run reuses the container and the cluster. */
TEST_F(OrchestratorTest, Idempotent) {
  const PrepareOutcome FIRST = prepare();
  ASSERT_TRUE(FIRST.status.ok());
  const std::size_t PROBES = ports_.probes;

  const PrepareOutcome SECOND = prepare();
  ASSERT_TRUE(SECOND.status.ok()) << SECOND.status.toString();
  EXPECT_TRUE(SECOND.report.ready);
  EXPECT_EQ(host_.count("docker run"), 1U);
  EXPECT_EQ(host_.count("kind create cluster"), 1U);
  EXPECT_EQ(host_.count("docker network connect"), 1U);
  EXPECT_EQ(ports_.probes, PROBES);
  ASSERT_TRUE(SECOND.report.localRegistry.has_value());
  EXPECT_TRUE(SECOND.report.localRegistry->reused);
  EXPECT_EQ(SECOND.report.localRegistry->hostPort, FIRST.report.localRegistry->hostPort);
  EXPECT_EQ(SECOND.report.localRegistry->phase, RegistryPhase::VALIDATED);
}

/** @test A stopped registry is started and keeps its port through cluster wiring. */
TEST_F(OrchestratorTest, RestartsStoppedRegistry) {
  host_.givenStoppedRegistry(6042);

  const PrepareOutcome OUT = prepare();

  ASSERT_TRUE(OUT.status.ok()) << OUT.status.toString();
  EXPECT_EQ(host_.count("docker start"), 1U);
  EXPECT_EQ(host_.count("docker run"), 0U);
  EXPECT_EQ(ports_.probes, 0U);
  ASSERT_TRUE(OUT.report.localRegistry.has_value());
  EXPECT_TRUE(OUT.report.localRegistry->restarted);
  EXPECT_EQ(OUT.report.localRegistry->hostPort, 6042);
  EXPECT_TRUE(OUT.report.localRegistry->mirrorConfigured);
  EXPECT_NE(host_.clusters.at("kindling").containerdConfig.find("\"localhost:6042\""),
            std::string::npos);
}

/** @test Occupied ports are skipped when choosing a fresh registry port. */
TEST_F(OrchestratorTest, SkipsBusyPorts) {
  ports_.taken = {6000, 6001};

  const PrepareOutcome OUT = prepare();

  ASSERT_TRUE(OUT.status.ok());
  EXPECT_EQ(host_.registryPort, 6002);
  EXPECT_EQ(OUT.report.localRegistry->hostPort, 6002);
}

/** @test amd64 images on an arm64 cluster are fatal in strict mode. */
TEST_F(OrchestratorTest, StrictPlatformMismatch) {
  kube_.node = NodeInfo{"arm64", "linux"};

  const PrepareOutcome OUT = prepare();

  EXPECT_EQ(OUT.status.kind, ErrorKind::PLATFORM_MISMATCH);
  EXPECT_FALSE(OUT.report.ready);
  EXPECT_EQ(OUT.report.checks.platformCompatible, false);
  ASSERT_TRUE(OUT.report.platformVerdict.has_value());
  EXPECT_EQ(OUT.report.platformVerdict->cluster, Platform::LINUX_ARM64);
}

/** @test Lenient mode reports the mismatch as a warning and stays ready. */
TEST_F(OrchestratorTest, LenientPlatformMismatch) {
  kube_.node = NodeInfo{"arm64", "linux"};
  PrepareRequest request;
  request.strict = false;

  const PrepareOutcome OUT = prepare(request);

  ASSERT_TRUE(OUT.status.ok());
  EXPECT_TRUE(OUT.report.ready);
  EXPECT_EQ(OUT.report.checks.platformCompatible, false);
  EXPECT_TRUE(anyWarning(OUT, "linux/amd64", "linux/arm64"));
}

/** @test Existing cluster with drifted nodes fails after its kubeconfig is exported. */
TEST_F(OrchestratorTest, StrictDriftOnExistingCluster) {
  ASSERT_TRUE(prepare().status.ok());
  kube_.node = NodeInfo{"arm64", "linux"};

  const PrepareOutcome OUT = prepare();

  EXPECT_EQ(OUT.status.kind, ErrorKind::PLATFORM_MISMATCH);
  EXPECT_NE(OUT.status.guidance.resolution.find("kind delete cluster --name kindling"),
            std::string::npos);
  EXPECT_EQ(host_.count("kind export kubeconfig"), 2U);
}

/** @test Invalid namespace is rejected before anything runs. */
TEST_F(OrchestratorTest, InvalidNamespace) {
  PrepareRequest request;
  request.ns = "Bad_Namespace";

  const PrepareOutcome OUT = prepare(request);

  EXPECT_EQ(OUT.status.kind, ErrorKind::VALIDATION);
  EXPECT_NE(OUT.status.guidance.message.find("Bad_Namespace"), std::string::npos);
  EXPECT_TRUE(host_.calls().empty());
  EXPECT_FALSE(OUT.report.ready);
}

/** @test Configured development cluster name must be a valid identifier. */
TEST_F(OrchestratorTest, InvalidClusterName) {
  config_.clusterName = "dev.cluster";

  const PrepareOutcome OUT = prepare();

  EXPECT_EQ(OUT.status.kind, ErrorKind::VALIDATION);
  EXPECT_TRUE(host_.calls().empty());
}

/** @test Staging only verifies; a missing namespace leaves the cluster not ready. */
TEST_F(OrchestratorTest, StagingVerifiesOnly) {
  PrepareRequest request;
  request.environment = Environment::STAGING;
  request.ns = "apps";

  const PrepareOutcome OUT = prepare(request);

  ASSERT_TRUE(OUT.status.ok());
  EXPECT_FALSE(OUT.report.ready);
  EXPECT_EQ(OUT.report.cluster, "default");
  EXPECT_FALSE(OUT.report.localRegistry.has_value());
  EXPECT_FALSE(OUT.report.checks.registryCreated.has_value());
  EXPECT_TRUE(host_.calls().empty());
  EXPECT_TRUE(kube_.created.empty());
  EXPECT_TRUE(anyWarning(OUT, "Namespace apps", "does not exist"));
}

/** @test Production creates the namespace and the service account. */
TEST_F(OrchestratorTest, ProductionManagesNamespace) {
  PrepareRequest request;
  request.environment = Environment::PRODUCTION;
  request.ns = "apps";

  const PrepareOutcome OUT = prepare(request);

  ASSERT_TRUE(OUT.status.ok()) << OUT.status.toString();
  EXPECT_TRUE(OUT.report.ready);
  EXPECT_TRUE(OUT.report.namespaceCreated);
  ASSERT_EQ(kube_.created.size(), 1U);
  EXPECT_EQ(kube_.created[0], "apps");
  EXPECT_EQ(OUT.report.checks.rbacConfigured, true);
  ASSERT_EQ(kube_.applied.size(), 1U);
  EXPECT_NE(kube_.applied[0].find("app-service-account"), std::string::npos);
  EXPECT_NE(OUT.report.summary().find("Namespace 'apps' created"), std::string::npos);
}

/** @test Unreachable cluster returns the partial report with the failure. */
TEST_F(OrchestratorTest, UnreachableCluster) {
  kube_.reachable = false;
  PrepareRequest request;
  request.environment = Environment::TESTING;

  const PrepareOutcome OUT = prepare(request);

  EXPECT_EQ(OUT.status.kind, ErrorKind::CONNECTIVITY);
  EXPECT_FALSE(OUT.report.ready);
  EXPECT_FALSE(OUT.report.checks.connectivity);
  EXPECT_FALSE(OUT.report.platformVerdict.has_value());
  EXPECT_NE(OUT.report.summary().find("cluster unreachable"), std::string::npos);
}
