/**
 * @file DockerCli_uTest.cpp
 * @brief Unit tests for kindling::docker::DockerCli output parsing.
 */

#include "src/common/inc/Log.hpp"
#include "src/docker/inc/DockerCli.hpp"
#include "src/exec/utst/FakeCommandRunner.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using kindling::common::makeNullLogger;
using kindling::docker::ContainerState;
using kindling::docker::DockerCli;
using kindling::docker::JoinResult;
using kindling::exec::CmdResult;
using kindling::exec::testing::FakeCommandRunner;

class DockerCliTest : public ::testing::Test {
protected:
  FakeCommandRunner runner_;
  DockerCli docker_{runner_, makeNullLogger(), std::chrono::milliseconds(1000)};
};

/* ----------------------------- State ----------------------------- */

/** @test Name filter is a prefix match, so only an exact line counts. */
TEST_F(DockerCliTest, StateRequiresExactName) {
  runner_.on("docker ps -a", CmdResult::success("kindling-registry-old\n"));
  EXPECT_EQ(docker_.registryState(), ContainerState::ABSENT);
  EXPECT_EQ(runner_.count("docker inspect"), 0U);
}

/** @test Status maps running and everything else. */
TEST_F(DockerCliTest, StateFromInspect) {
  runner_.on("docker ps -a", CmdResult::success("kindling-registry\n"));
  runner_.on("{{.State.Status}}", CmdResult::success("running\n"));
  EXPECT_EQ(docker_.registryState(), ContainerState::RUNNING);

  runner_.on("{{.State.Status}}", CmdResult::success("exited\n"));
  EXPECT_EQ(docker_.registryState(), ContainerState::STOPPED);
}

/** @test Docker daemon errors read as absent. */
TEST_F(DockerCliTest, StateDaemonDown) {
  runner_.on("docker ps", CmdResult::failure("Cannot connect to the Docker daemon"));
  EXPECT_EQ(docker_.registryState(), ContainerState::ABSENT);
}

/* ----------------------------- Port ----------------------------- */

/** @test Published port parses from the binding template. */
TEST_F(DockerCliTest, PublishedPort) {
  runner_.on("HostConfig.PortBindings \"5000/tcp\"", CmdResult::success("6003\n"));
  const auto PORT = docker_.publishedPort(5000);
  ASSERT_TRUE(PORT.has_value());
  EXPECT_EQ(*PORT, 6003);
}

/** @test Missing or malformed bindings yield nothing. */
TEST_F(DockerCliTest, PublishedPortMissing) {
  runner_.on("HostConfig.PortBindings", CmdResult::success("\n"));
  EXPECT_FALSE(docker_.publishedPort(5000).has_value());
  runner_.on("HostConfig.PortBindings", CmdResult::success("70000\n"));
  EXPECT_FALSE(docker_.publishedPort(5000).has_value());
}

/* ----------------------------- Lifecycle ----------------------------- */

/** @test Run uses restart policy and the fixed container name. */
TEST_F(DockerCliTest, RunRegistryCommand) {
  runner_.on("docker run", CmdResult::success("id\n"));
  EXPECT_TRUE(docker_.runRegistry(6010).ok());
  ASSERT_EQ(runner_.calls().size(), 1U);
  EXPECT_EQ(runner_.calls()[0],
            "docker run -d --restart=always -p 6010:5000 --name kindling-registry registry:2");
}

/** @test Logs merge stdout and stderr. */
TEST_F(DockerCliTest, RegistryLogs) {
  CmdResult r = CmdResult::success("out\n");
  r.err = "err\n";
  runner_.on("docker logs --tail 5 kindling-registry", r);
  EXPECT_EQ(docker_.registryLogs(5), "out\nerr\n");
}

/* ----------------------------- Networks ----------------------------- */

/** @test Network listing needs the exact network name. */
TEST_F(DockerCliTest, ClusterNetworkExists) {
  runner_.on("docker network ls", CmdResult::success("kind-other\n"));
  EXPECT_FALSE(docker_.clusterNetworkExists());
  runner_.on("docker network ls", CmdResult::success("kind\n"));
  EXPECT_TRUE(docker_.clusterNetworkExists());
}

/** @test Network names split on whitespace. */
TEST_F(DockerCliTest, RegistryNetworks) {
  runner_.on("range $net", CmdResult::success("bridge kind \n"));
  const auto NETS = docker_.registryNetworks();
  ASSERT_EQ(NETS.size(), 2U);
  EXPECT_EQ(NETS[1], "kind");
}

/** @test Join outcomes. */
TEST_F(DockerCliTest, JoinOutcomes) {
  std::string error;
  runner_.on("docker network connect kind kindling-registry", CmdResult::success(""));
  EXPECT_EQ(docker_.joinClusterNetwork(error), JoinResult::JOINED);

  runner_.on("docker network connect",
             CmdResult::failure("Error response from daemon: endpoint with name "
                                "kindling-registry already exists in network kind"));
  EXPECT_EQ(docker_.joinClusterNetwork(error), JoinResult::ALREADY_JOINED);
  EXPECT_TRUE(error.empty());

  runner_.on("docker network connect", CmdResult::failure("network kind not found\n"));
  EXPECT_EQ(docker_.joinClusterNetwork(error), JoinResult::FAILED);
  EXPECT_EQ(error, "network kind not found");
}

/** @test Cluster address comes from the kind network entry. */
TEST_F(DockerCliTest, ClusterAddress) {
  runner_.on("Networks \"kind\"", CmdResult::success("172.18.0.5\n"));
  EXPECT_EQ(docker_.registryClusterAddress(), "172.18.0.5");
}
