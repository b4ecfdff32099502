/**
 * @file Environment.cpp
 * @brief Environment names and policy table.
 */

#include "src/prepare/inc/Environment.hpp"

#include <initializer_list>

namespace kindling {

namespace prepare {

const char* toString(Environment env) noexcept {
  switch (env) {
  case Environment::DEVELOPMENT:
    return "development";
  case Environment::STAGING:
    return "staging";
  case Environment::TESTING:
    return "testing";
  case Environment::PRODUCTION:
    return "production";
  }
  return "unknown";
}

std::optional<Environment> parseEnvironment(std::string_view text) noexcept {
  for (const Environment ENV : {Environment::DEVELOPMENT, Environment::STAGING,
                                Environment::TESTING, Environment::PRODUCTION}) {
    if (text == toString(ENV)) {
      return ENV;
    }
  }
  return std::nullopt;
}

EnvironmentPolicy policyFor(Environment env) noexcept {
  EnvironmentPolicy policy;
  switch (env) {
  case Environment::DEVELOPMENT:
    policy.provisionLocal = true;
    policy.useDevCluster = true;
    break;
  case Environment::STAGING:
  case Environment::TESTING:
    break;
  case Environment::PRODUCTION:
    policy.createNamespace = true;
    policy.setupRbac = true;
    break;
  }
  return policy;
}

} // namespace prepare

} // namespace kindling
