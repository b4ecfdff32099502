/**
 * @file MirrorConfig_uTest.cpp
 * @brief Unit tests for kindling::registry mirror stanza rendering and scanning.
 */

#include "src/registry/inc/MirrorConfig.hpp"

#include <gtest/gtest.h>

#include <string>

using kindling::registry::containerdMirrorPatch;
using kindling::registry::inspectMirrorConfig;
using kindling::registry::MirrorCheck;
using kindling::registry::mirrorSnippet;
using kindling::registry::mirrorStanza;

namespace {

/// Excerpt of a kind node config.toml after the mirror patch was merged.
constexpr const char* NODE_CONFIG = R"(version = 2

[plugins."io.containerd.grpc.v1.cri".containerd]
  default_runtime_name = "runc"

[plugins."io.containerd.grpc.v1.cri".registry.mirrors."localhost:6001"]
  endpoint = ["http://kindling-registry:5000"]

[plugins."io.containerd.grpc.v1.cri".registry.mirrors."kindling-registry:5000"]
  endpoint = [ "http://kindling-registry:5000" ]
)";

} // namespace

/** @test Patch contains both mirror tables with the internal endpoint. */
TEST(MirrorConfigTest, PatchHasBothMirrors) {
  const std::string PATCH = containerdMirrorPatch(6001);
  EXPECT_NE(PATCH.find(mirrorStanza("localhost:6001")), std::string::npos);
  EXPECT_NE(PATCH.find(mirrorStanza("kindling-registry:5000")), std::string::npos);
  EXPECT_NE(PATCH.find("endpoint = [\"http://kindling-registry:5000\"]"), std::string::npos);
}

/** @test A rendered patch passes its own inspection. */
TEST(MirrorConfigTest, RenderedPatchInspectsClean) {
  EXPECT_TRUE(inspectMirrorConfig(containerdMirrorPatch(6042), 6042).ok());
}

/** @test Merged node config is recognized for the matching port. */
TEST(MirrorConfigTest, NodeConfigMatches) {
  const MirrorCheck CHECK = inspectMirrorConfig(NODE_CONFIG, 6001);
  EXPECT_TRUE(CHECK.stanzaFound);
  EXPECT_TRUE(CHECK.endpointFound);
}

/** @test A different host port is not accepted. */
TEST(MirrorConfigTest, WrongPortRejected) {
  const MirrorCheck CHECK = inspectMirrorConfig(NODE_CONFIG, 6002);
  EXPECT_FALSE(CHECK.stanzaFound);
  EXPECT_FALSE(CHECK.ok());
}

/** @test Endpoint must live inside the localhost table. */
TEST(MirrorConfigTest, EndpointOutsideStanzaRejected) {
  const std::string CONFIG =
      "[plugins.\"io.containerd.grpc.v1.cri\".registry.mirrors.\"localhost:6001\"]\n"
      "  endpoint = [\"http://elsewhere:5000\"]\n"
      "[plugins.\"io.containerd.grpc.v1.cri\".registry.mirrors.\"kindling-registry:5000\"]\n"
      "  endpoint = [\"http://kindling-registry:5000\"]\n";
  const MirrorCheck CHECK = inspectMirrorConfig(CONFIG, 6001);
  EXPECT_TRUE(CHECK.stanzaFound);
  EXPECT_FALSE(CHECK.endpointFound);
}

/** @test Snippet keeps only mirror tables. */
TEST(MirrorConfigTest, SnippetFiltersMirrors) {
  const std::string SNIPPET = mirrorSnippet(NODE_CONFIG);
  EXPECT_EQ(SNIPPET.find("default_runtime_name"), std::string::npos);
  EXPECT_NE(SNIPPET.find("localhost:6001"), std::string::npos);
}
