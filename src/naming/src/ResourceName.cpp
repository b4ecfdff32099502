/**
 * @file ResourceName.cpp
 * @brief DNS-1123 label validation.
 */

#include "src/naming/inc/ResourceName.hpp"

namespace kindling {

namespace naming {

namespace {

constexpr bool isLowerAlnum(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

/// Position of the first grammar violation, or npos when the text conforms.
std::size_t findViolation(std::string_view s) noexcept {
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char C = s[i];
    const bool EDGE = (i == 0 || i + 1 == s.size());
    if (isLowerAlnum(C)) {
      continue;
    }
    if (C == '-' && !EDGE) {
      continue;
    }
    return i;
  }
  return std::string_view::npos;
}

} // namespace

/* ----------------------------- NameRejection toString ----------------------------- */

const char* toString(NameRejection reason) noexcept {
  switch (reason) {
  case NameRejection::NONE:
    return "none";
  case NameRejection::EMPTY:
    return "empty";
  case NameRejection::CHARSET:
    return "charset";
  case NameRejection::LENGTH:
    return "length";
  }
  return "unknown";
}

/* ----------------------------- validateName ----------------------------- */

NameCheck validateName(std::string_view candidate) {
  NameCheck check;

  if (candidate.empty()) {
    check.reason = NameRejection::EMPTY;
    check.detail = "name must not be empty";
    return check;
  }

  const std::size_t BAD = findViolation(candidate);
  if (BAD != std::string_view::npos) {
    check.reason = NameRejection::CHARSET;
    check.detail = fmt::format(
        "invalid character '{}' at position {}: names must consist of lowercase alphanumeric "
        "characters or '-', and must start and end with an alphanumeric character",
        candidate[BAD], BAD);
    return check;
  }

  if (candidate.size() > MAX_NAME_LENGTH) {
    check.reason = NameRejection::LENGTH;
    check.detail =
        fmt::format("name is {} characters, maximum is {}", candidate.size(), MAX_NAME_LENGTH);
    return check;
  }

  check.name = ResourceName(std::string(candidate));
  return check;
}

} // namespace naming

} // namespace kindling
