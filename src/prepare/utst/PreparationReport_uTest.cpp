/**
 * @file PreparationReport_uTest.cpp
 * @brief Unit tests for kindling::prepare::PreparationReport renderings.
 */

#include "src/prepare/inc/PreparationReport.hpp"

#include <gtest/gtest.h>

#include <string>

using kindling::platform::Platform;
using kindling::platform::PlatformVerdict;
using kindling::prepare::Environment;
using kindling::prepare::PreparationReport;
using kindling::registry::RegistryDescriptor;
using kindling::registry::RegistryPhase;

namespace {

PreparationReport readyReport() {
  PreparationReport r{};
  r.cluster = "kindling";
  r.ns = "apps";
  r.environment = Environment::DEVELOPMENT;
  r.checks.connectivity = true;
  r.checks.permissions = true;
  r.checks.namespaceExists = true;
  r.checks.ingressController = false;
  r.ready = true;
  return r;
}

} // namespace

/** @test Ready summary counts passed checks and names the namespace action. */
TEST(PreparationReportTest, ReadySummary) {
  PreparationReport r = readyReport();
  EXPECT_EQ(r.summary(), "Cluster prepared. Namespace 'apps' verified. 3 checks passed. "
                         "Ready for deployment.");

  r.namespaceCreated = true;
  r.checks.ingressController = true;
  EXPECT_EQ(r.summary(), "Cluster prepared. Namespace 'apps' created. 4 checks passed. "
                         "Ready for deployment.");
}

/** @test Not-ready summary gives the first missing requirement. */
TEST(PreparationReportTest, NotReadySummary) {
  PreparationReport r = readyReport();
  r.ready = false;
  r.checks.namespaceExists = false;
  r.warnings.push_back("Namespace apps does not exist - deployment may fail");
  EXPECT_EQ(r.summary(), "Cluster kindling not ready for deployment to namespace 'apps': "
                         "namespace missing. 1 warning.");

  r.checks.connectivity = false;
  r.warnings.push_back("second");
  EXPECT_EQ(r.summary(), "Cluster kindling not ready for deployment to namespace 'apps': "
                         "cluster unreachable. 2 warnings.");
}

/** @test Unattempted checks and absent sections stay out of the JSON. */
TEST(PreparationReportTest, JsonOmitsUnsetFields) {
  const std::string JSON = readyReport().toJson();
  EXPECT_NE(JSON.find("\"ready\": true"), std::string::npos);
  EXPECT_NE(JSON.find("\"environment\": \"development\""), std::string::npos);
  EXPECT_NE(JSON.find("\"ingressController\": false"), std::string::npos);
  EXPECT_EQ(JSON.find("rbacConfigured"), std::string::npos);
  EXPECT_EQ(JSON.find("platformCompatible"), std::string::npos);
  EXPECT_EQ(JSON.find("localRegistry"), std::string::npos);
  EXPECT_EQ(JSON.find("\"platform\""), std::string::npos);
  EXPECT_NE(JSON.find("\"warnings\": []"), std::string::npos);
}

/** @test Registry, platform and warnings appear with escaped text. */
TEST(PreparationReportTest, JsonSections) {
  PreparationReport r = readyReport();
  RegistryDescriptor reg{};
  reg.hostPort = 6001;
  reg.phase = RegistryPhase::VALIDATED;
  r.localRegistry = reg;
  PlatformVerdict verdict{};
  verdict.target = Platform::LINUX_AMD64;
  verdict.cluster = Platform::LINUX_ARM64;
  r.platformVerdict = verdict;
  r.warnings.push_back("quote \" and\nnewline");

  const std::string JSON = r.toJson();
  EXPECT_NE(JSON.find("\"externalUrl\": \"localhost:6001\""), std::string::npos);
  EXPECT_NE(JSON.find("\"hostPort\": 6001"), std::string::npos);
  EXPECT_NE(JSON.find("\"cluster\": \"linux/arm64\""), std::string::npos);
  EXPECT_NE(JSON.find("\"compatible\": false"), std::string::npos);
  EXPECT_NE(JSON.find("quote \\\" and\\nnewline"), std::string::npos);
}

/** @test Human block lists every check, skipped ones included. */
TEST(PreparationReportTest, HumanBlock) {
  const std::string TEXT = readyReport().toString();
  EXPECT_NE(TEXT.find("Cluster:     kindling (development)"), std::string::npos);
  EXPECT_NE(TEXT.find("ingressController  fail"), std::string::npos);
  EXPECT_NE(TEXT.find("rbacConfigured     skipped"), std::string::npos);
  EXPECT_EQ(TEXT.find("Warnings:"), std::string::npos);
}
