/**
 * @file ReadinessChecker_uTest.cpp
 * @brief Unit tests for kindling::readiness::ReadinessChecker.
 */

#include "src/common/inc/Log.hpp"
#include "src/kube/utst/FakeKubeClient.hpp"
#include "src/readiness/inc/ReadinessChecker.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using kindling::common::ErrorKind;
using kindling::common::makeNullLogger;
using kindling::common::Status;
using kindling::kube::testing::FakeKubeClient;
using kindling::naming::ResourceName;
using kindling::naming::validateName;
using kindling::readiness::ReadinessChecker;
using kindling::readiness::ReadinessChecks;
using kindling::readiness::ReadinessPolicy;

class ReadinessCheckerTest : public ::testing::Test {
protected:
  FakeKubeClient kube_;
  ReadinessChecker checker_{kube_, makeNullLogger()};
  ReadinessChecks checks_;
  std::vector<std::string> warnings_;
  bool created_{false};
  ResourceName apps_{*validateName("apps").name};

  Status run(const ReadinessPolicy& policy) {
    return checker_.verify(apps_, policy, checks_, created_, warnings_);
  }
};

/** @test Unreachable cluster stops before any other check. */
TEST_F(ReadinessCheckerTest, Unreachable) {
  kube_.reachable = false;
  const Status S = run(ReadinessPolicy{});
  EXPECT_EQ(S.kind, ErrorKind::CONNECTIVITY);
  EXPECT_NE(S.guidance.resolution.find("kubectl cluster-info"), std::string::npos);
  EXPECT_FALSE(checks_.permissions);
  EXPECT_FALSE(checks_.ingressController.has_value());
  EXPECT_FALSE(checks_.ready());
}

/** @test Missing rights is a permission failure with can-i remediation. */
TEST_F(ReadinessCheckerTest, Forbidden) {
  kube_.allowed = false;
  const Status S = run(ReadinessPolicy{});
  EXPECT_EQ(S.kind, ErrorKind::PERMISSION);
  EXPECT_NE(S.guidance.resolution.find("kubectl auth can-i"), std::string::npos);
  EXPECT_TRUE(checks_.connectivity);
}

/** @test Missing namespace without create policy warns and is not ready. */
TEST_F(ReadinessCheckerTest, MissingNamespaceWarns) {
  ASSERT_TRUE(run(ReadinessPolicy{}).ok());
  EXPECT_FALSE(checks_.namespaceExists);
  EXPECT_FALSE(created_);
  EXPECT_FALSE(checks_.ready());
  ASSERT_EQ(warnings_.size(), 1U);
  EXPECT_EQ(warnings_[0], "Namespace apps does not exist - deployment may fail");
}

/** @test Create policy creates the namespace and RBAC applies the ServiceAccount. */
TEST_F(ReadinessCheckerTest, ProductionPolicy) {
  ASSERT_TRUE(run(ReadinessPolicy{true, true, true}).ok());
  EXPECT_TRUE(checks_.namespaceExists);
  EXPECT_TRUE(created_);
  ASSERT_EQ(kube_.created.size(), 1U);
  EXPECT_EQ(kube_.created[0], "apps");
  ASSERT_TRUE(checks_.rbacConfigured.has_value());
  EXPECT_TRUE(*checks_.rbacConfigured);
  ASSERT_EQ(kube_.applied.size(), 1U);
  EXPECT_NE(kube_.applied[0].find("app-service-account"), std::string::npos);
  EXPECT_TRUE(checks_.ready());
  EXPECT_TRUE(warnings_.empty());
}

/** @test Namespace creation failure is fatal. */
TEST_F(ReadinessCheckerTest, CreateNamespaceFails) {
  kube_.canCreateNamespaces = false;
  EXPECT_EQ(run(ReadinessPolicy{true, false, true}).kind, ErrorKind::PROVISIONING);
  EXPECT_FALSE(checks_.ready());
}

/** @test RBAC failure only warns. */
TEST_F(ReadinessCheckerTest, RbacFailureWarns) {
  kube_.namespaces.insert("apps");
  kube_.applyOk = false;
  ASSERT_TRUE(run(ReadinessPolicy{false, true, false}).ok());
  ASSERT_TRUE(checks_.rbacConfigured.has_value());
  EXPECT_FALSE(*checks_.rbacConfigured);
  EXPECT_EQ(warnings_.size(), 1U);
  EXPECT_TRUE(checks_.ready());
}

/** @test Absent ingress controller warns; skipping leaves the check unset. */
TEST_F(ReadinessCheckerTest, Ingress) {
  kube_.namespaces.insert("apps");
  kube_.ingress = false;
  ASSERT_TRUE(run(ReadinessPolicy{}).ok());
  ASSERT_TRUE(checks_.ingressController.has_value());
  EXPECT_FALSE(*checks_.ingressController);
  EXPECT_EQ(warnings_.size(), 1U);

  ReadinessChecks fresh;
  checks_ = fresh;
  ASSERT_TRUE(run(ReadinessPolicy{false, false, false}).ok());
  EXPECT_FALSE(checks_.ingressController.has_value());
}

/** @test Pass count covers mandatory and attempted optional checks. */
TEST(ReadinessChecksTest, Passed) {
  ReadinessChecks c;
  c.connectivity = true;
  c.permissions = true;
  c.namespaceExists = true;
  c.ingressController = false;
  c.clusterCreated = true;
  EXPECT_EQ(c.passed(), 4U);
  EXPECT_NE(c.toString().find("ingressController=false"), std::string::npos);
  EXPECT_EQ(c.toString().find("rbacConfigured"), std::string::npos);
}
