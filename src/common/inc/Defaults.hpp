#ifndef KINDLING_COMMON_DEFAULTS_HPP
#define KINDLING_COMMON_DEFAULTS_HPP
/**
 * @file Defaults.hpp
 * @brief Fixed names, images, ports and versions.
 *
 * Values that reach a subprocess command line are string literals so the
 * command builder accepts them without validation.
 */

#include <cstdint>

namespace kindling {
namespace common {

/* ----------------------------- Registry ----------------------------- */

/// Registry container name, also its DNS name on the cluster network.
inline constexpr char REGISTRY_CONTAINER_NAME[] = "kindling-registry";

/// Registry image.
inline constexpr char REGISTRY_IMAGE[] = "registry:2";

/// Port the registry listens on inside its container.
inline constexpr std::uint16_t REGISTRY_INTERNAL_PORT = 5000;

/// Host name used for the externally published registry port.
inline constexpr char REGISTRY_HOST[] = "localhost";

/// Inclusive host port range scanned for a free registry port.
inline constexpr std::uint16_t REGISTRY_PORT_START = 6000;
inline constexpr std::uint16_t REGISTRY_PORT_END = 6100;

/// Docker network created by kind for its node containers.
inline constexpr char CLUSTER_NETWORK[] = "kind";

/// Path of the containerd configuration inside a kind node.
inline constexpr char CONTAINERD_CONFIG_PATH[] = "/etc/containerd/config.toml";

/* ----------------------------- Probe pods ----------------------------- */

inline constexpr char HTTP_PROBE_IMAGE[] = "--image=curlimages/curl:latest";
inline constexpr char DNS_PROBE_IMAGE[] = "--image=busybox:latest";
inline constexpr char PROBE_OK_MARKER[] = "PROBE_OK";
inline constexpr char PROBE_FAILED_MARKER[] = "PROBE_FAILED";

/* ----------------------------- Cluster ----------------------------- */

/// kind release installed when the binary is missing.
inline constexpr char KIND_VERSION[] = "v0.20.0";

/// amd64 node image pinned for emulated clusters on arm64 hosts.
inline constexpr char KIND_AMD64_NODE_IMAGE[] =
    "kindest/node:v1.27.3@sha256:3966ac761ae0136263ffdb6cfd4db23ef8a83cba8a463690e98317add2c9ba72";

/// Cluster name used for the development environment.
inline constexpr char DEV_CLUSTER_NAME[] = "kindling";

/// Cluster name reported for every other environment.
inline constexpr char DEFAULT_CLUSTER_NAME[] = "default";

/// Namespace used when the caller supplies none.
inline constexpr char DEFAULT_NAMESPACE[] = "default";

/// Service account created when RBAC setup is requested.
inline constexpr char SERVICE_ACCOUNT_NAME[] = "app-service-account";

/// Ingress host port mappings on the control-plane node.
inline constexpr std::uint16_t INGRESS_HTTP_PORT = 80;
inline constexpr std::uint16_t INGRESS_HTTPS_PORT = 443;

/// Published documentation link for the registry hosting ConfigMap.
inline constexpr char REGISTRY_HOSTING_HELP_URL[] =
    "https://kind.sigs.k8s.io/docs/user/local-registry/";

} // namespace common
} // namespace kindling

#endif // KINDLING_COMMON_DEFAULTS_HPP
