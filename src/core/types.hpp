/**
 * @file types.hpp
 * @brief Scheduler-private device model carried on orchestrator objects.
 *
 * NodeInfo, PodInfo and ContainerInfo are owned by the device scheduler and
 * travel inside a single annotation of the corresponding orchestrator object.
 * All types have value semantics; every map is always constructed, so there
 * is no partially built model to guard against.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace kube_device {

// ─────────────────────────────────────────────
// Resource Vocabulary
// ─────────────────────────────────────────────

using ResourceName = std::string;
using ResourceList = std::map<ResourceName, int64_t>;

/// Resource name -> concrete device instance it is served from.
using ResourceLocation = std::map<ResourceName, ResourceName>;

/// Per-resource scorer selector; opaque to this library.
using ResourceScorer = std::map<ResourceName, int32_t>;

// ─────────────────────────────────────────────
// Node
// ─────────────────────────────────────────────

struct NodeInfo {
    std::string name;
    ResourceList capacity;       ///< Device capacity as advertised
    ResourceList allocatable;    ///< Device allocatable as advertised
    ResourceList used;           ///< Scheduler-private cumulative usage
    ResourceScorer scorer;
    ResourceList kube_cap;       ///< Copied from orchestrator status.capacity
    ResourceList kube_alloc;     ///< Copied from orchestrator status.allocatable

    bool operator==(const NodeInfo&) const = default;
};

// ─────────────────────────────────────────────
// Pod
// ─────────────────────────────────────────────

struct ContainerInfo {
    ResourceList kube_requests;  ///< Always overwritten from the live container spec
    ResourceList requests;       ///< Scheduler-semantic requests
    ResourceList dev_requests;   ///< Outstanding device requests
    ResourceLocation allocate_from;
    ResourceScorer scorer;

    bool operator==(const ContainerInfo&) const = default;
};

using ContainerMap = std::map<std::string, ContainerInfo>;

struct PodInfo {
    std::string name;
    std::string node_name;       ///< Scheduler assignment, not the orchestrator binding
    ResourceList requests;
    ContainerMap init_containers;
    ContainerMap running_containers;

    bool operator==(const PodInfo&) const = default;
};

[[nodiscard]] inline NodeInfo new_node_info() { return NodeInfo{}; }
[[nodiscard]] inline PodInfo new_pod_info() { return PodInfo{}; }
[[nodiscard]] inline ContainerInfo new_container_info() { return ContainerInfo{}; }

}  // namespace kube_device
