/**
 * @file Manifests_uTest.cpp
 * @brief Unit tests for kindling::kube manifest emitters.
 *
 * Notes:
 *  - Output is re-parsed with yaml-cpp and checked field by field.
 */

#include "src/kube/inc/Manifests.hpp"

#include <gtest/gtest.h>

#include <string>

#include <yaml-cpp/yaml.h>

using kindling::kube::registryHostingConfigMap;
using kindling::kube::serviceAccountManifest;
using kindling::naming::validateName;

/** @test ServiceAccount manifest carries name and namespace. */
TEST(ManifestsTest, ServiceAccount) {
  const auto NS = validateName("prod");
  ASSERT_TRUE(NS.ok());
  const YAML::Node DOC = YAML::Load(serviceAccountManifest("app-service-account", *NS.name));
  EXPECT_EQ(DOC["kind"].as<std::string>(), "ServiceAccount");
  EXPECT_EQ(DOC["metadata"]["name"].as<std::string>(), "app-service-account");
  EXPECT_EQ(DOC["metadata"]["namespace"].as<std::string>(), "prod");
}

/** @test Hosting ConfigMap advertises the external registry address. */
TEST(ManifestsTest, RegistryHostingConfigMap) {
  const YAML::Node DOC = YAML::Load(registryHostingConfigMap(6003));
  EXPECT_EQ(DOC["kind"].as<std::string>(), "ConfigMap");
  EXPECT_EQ(DOC["metadata"]["name"].as<std::string>(), "local-registry-hosting");
  EXPECT_EQ(DOC["metadata"]["namespace"].as<std::string>(), "kube-public");

  const std::string VALUE = DOC["data"]["localRegistryHosting.v1"].as<std::string>();
  const YAML::Node HOSTING = YAML::Load(VALUE);
  EXPECT_EQ(HOSTING["host"].as<std::string>(), "localhost:6003");
  EXPECT_NE(HOSTING["help"].as<std::string>().find("local-registry"), std::string::npos);
}
