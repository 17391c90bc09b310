/**
 * @file reconciler.hpp
 * @brief Merge decoded device state with the orchestrator's authoritative fields.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "kube/objects.hpp"

#include <vector>

namespace kube_device {

/**
 * @brief Builds the scheduler's view of a node or pod from a fresh object.
 *
 * Stateless apart from the logger; every call decodes the annotation it is
 * handed and never retains the object.
 */
class Reconciler {
public:
    explicit Reconciler(Logger& logger);

    /**
     * @brief Decode node state from `meta` and fold in cached usage.
     *
     * An empty decoded name falls back to the object's name. Every entry of
     * `existing->used` overwrites the decoded value for the same resource;
     * decoded entries the cache does not know are kept.
     */
    [[nodiscard]] Result<NodeInfo> reconcile_node_annotation(const kube::ObjectMeta& meta,
                                                             const NodeInfo* existing = nullptr) const;

    /// reconcile_node_annotation() plus kube_cap/kube_alloc from the node status.
    [[nodiscard]] Result<NodeInfo> reconcile_node(const kube::Node& node,
                                                  const NodeInfo* existing = nullptr) const;

    /**
     * @brief Decode pod state and overlay declared container requests.
     *
     * With `invalidate`, tentative allocations are discarded: allocate_from is
     * emptied, dev_requests is rebuilt from requests and node_name is cleared.
     */
    [[nodiscard]] Result<PodInfo> reconcile_pod(const kube::Pod& pod, bool invalidate) const;

    /// Discard tentative allocation bookkeeping in place. Idempotent.
    static void invalidate(PodInfo& info);

private:
    static void merge_declared_requests(ContainerMap& containers,
                                        const std::vector<kube::Container>& declared);

    Logger& logger_;
};

}  // namespace kube_device
