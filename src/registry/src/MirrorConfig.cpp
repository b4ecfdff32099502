/**
 * @file MirrorConfig.cpp
 * @brief containerd mirror stanza rendering and config.toml scanning.
 */

#include "src/registry/inc/MirrorConfig.hpp"
#include "src/common/inc/Defaults.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <fmt/core.h>

namespace kindling {

namespace registry {

namespace {

using helpers::strings::contains;
using helpers::strings::isSpace;
using helpers::strings::trim;

/// Copy of @p s with all whitespace removed.
std::string squeeze(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (const char C : s) {
    if (!isSpace(C)) {
      out += C;
    }
  }
  return out;
}

std::string internalEndpointUrl() {
  return fmt::format("http://{}:{}", common::REGISTRY_CONTAINER_NAME,
                     common::REGISTRY_INTERNAL_PORT);
}

} // namespace

/* ----------------------------- Rendering ----------------------------- */

std::string mirrorStanza(std::string_view mirrorHost) {
  return fmt::format("[plugins.\"io.containerd.grpc.v1.cri\".registry.mirrors.\"{}\"]",
                     mirrorHost);
}

std::string mirrorEndpointLine() {
  return fmt::format("endpoint = [\"{}\"]", internalEndpointUrl());
}

std::string containerdMirrorPatch(std::uint16_t hostPort) {
  const std::string EXTERNAL = fmt::format("{}:{}", common::REGISTRY_HOST, hostPort);
  const std::string INTERNAL =
      fmt::format("{}:{}", common::REGISTRY_CONTAINER_NAME, common::REGISTRY_INTERNAL_PORT);

  std::string out;
  out += mirrorStanza(EXTERNAL) + "\n";
  out += "  " + mirrorEndpointLine() + "\n";
  out += mirrorStanza(INTERNAL) + "\n";
  out += "  " + mirrorEndpointLine() + "\n";
  return out;
}

/* ----------------------------- Scanning ----------------------------- */

MirrorCheck inspectMirrorConfig(std::string_view configToml, std::uint16_t hostPort) {
  MirrorCheck check;
  const std::string STANZA = mirrorStanza(fmt::format("{}:{}", common::REGISTRY_HOST, hostPort));
  const std::string WANT_ENDPOINT = squeeze(mirrorEndpointLine());

  bool inStanza = false;
  std::size_t pos = 0;
  while (pos <= configToml.size()) {
    std::size_t nl = configToml.find('\n', pos);
    if (nl == std::string_view::npos) {
      nl = configToml.size();
    }
    const std::string_view LINE = trim(configToml.substr(pos, nl - pos));
    pos = nl + 1;

    if (!LINE.empty() && LINE.front() == '[') {
      inStanza = (squeeze(LINE) == squeeze(STANZA));
      check.stanzaFound = check.stanzaFound || inStanza;
      continue;
    }
    if (inStanza && squeeze(LINE) == WANT_ENDPOINT) {
      check.endpointFound = true;
    }
  }
  return check;
}

std::string mirrorSnippet(std::string_view configToml) {
  std::string out;
  std::size_t pos = 0;
  bool inMirror = false;
  while (pos < configToml.size()) {
    std::size_t nl = configToml.find('\n', pos);
    if (nl == std::string_view::npos) {
      nl = configToml.size();
    }
    const std::string_view LINE = configToml.substr(pos, nl - pos);
    const std::string_view TRIMMED = trim(LINE);
    pos = nl + 1;

    if (!TRIMMED.empty() && TRIMMED.front() == '[') {
      inMirror = contains(TRIMMED, "registry.mirrors");
    }
    if (inMirror) {
      out.append(LINE);
      out += '\n';
    }
  }
  return out;
}

} // namespace registry

} // namespace kindling
