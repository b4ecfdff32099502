/**
 * @file KindConfig_uTest.cpp
 * @brief Unit tests for kind config rendering.
 *
 * Output is parsed back with yaml-cpp and checked structurally.
 */

#include "src/cluster/inc/KindConfig.hpp"
#include "src/registry/inc/MirrorConfig.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <string>

using kindling::cluster::KindConfig;
using kindling::cluster::renderKindConfig;
using kindling::cluster::shouldPinAmd64Node;
using kindling::platform::HostInfo;
using kindling::platform::Platform;
using kindling::registry::inspectMirrorConfig;

/** @test Header fields and single control-plane node. */
TEST(KindConfigTest, Structure) {
  const YAML::Node DOC = YAML::Load(renderKindConfig(KindConfig{6004, ""}));
  EXPECT_EQ(DOC["kind"].as<std::string>(), "Cluster");
  EXPECT_EQ(DOC["apiVersion"].as<std::string>(), "kind.x-k8s.io/v1alpha4");
  ASSERT_EQ(DOC["nodes"].size(), 1U);
  const YAML::Node NODE = DOC["nodes"][0];
  EXPECT_EQ(NODE["role"].as<std::string>(), "control-plane");
  EXPECT_FALSE(NODE["image"]);
}

/** @test Mirror patch is embedded verbatim and scans as valid for the port. */
TEST(KindConfigTest, MirrorPatch) {
  const YAML::Node DOC = YAML::Load(renderKindConfig(KindConfig{6004, ""}));
  ASSERT_EQ(DOC["containerdConfigPatches"].size(), 1U);
  const std::string PATCH = DOC["containerdConfigPatches"][0].as<std::string>();
  EXPECT_TRUE(inspectMirrorConfig(PATCH, 6004).ok());
  EXPECT_FALSE(inspectMirrorConfig(PATCH, 6005).ok());
  EXPECT_NE(PATCH.find("mirrors.\"kindling-registry:5000\""), std::string::npos);
}

/** @test Ingress label patch and port mappings. */
TEST(KindConfigTest, IngressReadyNode) {
  const YAML::Node NODE = YAML::Load(renderKindConfig(KindConfig{6000, ""}))["nodes"][0];
  const YAML::Node PATCH = YAML::Load(NODE["kubeadmConfigPatches"][0].as<std::string>());
  EXPECT_EQ(PATCH["kind"].as<std::string>(), "InitConfiguration");
  EXPECT_EQ(PATCH["nodeRegistration"]["kubeletExtraArgs"]["node-labels"].as<std::string>(),
            "ingress-ready=true");

  const YAML::Node PORTS = NODE["extraPortMappings"];
  ASSERT_EQ(PORTS.size(), 2U);
  EXPECT_EQ(PORTS[0]["containerPort"].as<int>(), 80);
  EXPECT_EQ(PORTS[0]["hostPort"].as<int>(), 80);
  EXPECT_EQ(PORTS[1]["hostPort"].as<int>(), 443);
  EXPECT_EQ(PORTS[1]["protocol"].as<std::string>(), "TCP");
}

/** @test Node image appears only when given. */
TEST(KindConfigTest, NodeImage) {
  const YAML::Node DOC = YAML::Load(renderKindConfig(KindConfig{6000, "kindest/node:v1.27.3"}));
  EXPECT_EQ(DOC["nodes"][0]["image"].as<std::string>(), "kindest/node:v1.27.3");
}

/** @test Pinning needs lenient mode, an arm64 host and an amd64 target. */
TEST(KindConfigTest, PinRule) {
  const HostInfo ARM{"Darwin", "arm64"};
  const HostInfo X86{"Linux", "x86_64"};
  EXPECT_TRUE(shouldPinAmd64Node(false, ARM, Platform::LINUX_AMD64));
  EXPECT_FALSE(shouldPinAmd64Node(true, ARM, Platform::LINUX_AMD64));
  EXPECT_FALSE(shouldPinAmd64Node(false, X86, Platform::LINUX_AMD64));
  EXPECT_FALSE(shouldPinAmd64Node(false, ARM, Platform::LINUX_ARM64));
}
