/**
 * @file device_state_sync.hpp
 * @brief Top-level facade: read, claim and write back device state.
 *
 * Wires Reconciler, AnnotationCodec and UpdateOrchestrator over a node store
 * and a pod store:
 *
 *   read_*   store.get -> Reconciler
 *   write_*  AnnotationCodec into a copy -> UpdateOrchestrator -> store
 *
 * Holds no cache. Cached node usage is owned by the caller and passed in.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "kube/objects.hpp"
#include "reconciler/reconciler.hpp"
#include "store/object_store.hpp"
#include "update/update_orchestrator.hpp"

#include <string>

namespace kube_device {

/**
 * @brief A freshly fetched object together with its reconciled device state.
 */
template <typename ObjectT, typename InfoT>
struct Observed {
    ObjectT object;
    InfoT info;
};

using ObservedNode = Observed<kube::Node, NodeInfo>;
using ObservedPod = Observed<kube::Pod, PodInfo>;

class DeviceStateSync {
public:
    DeviceStateSync(NodeStore& nodes, PodStore& pods, Logger& logger);

    // Non-copyable, non-movable
    DeviceStateSync(const DeviceStateSync&) = delete;
    DeviceStateSync& operator=(const DeviceStateSync&) = delete;

    // ── Nodes ────────────────────────────────
    Result<ObservedNode> read_node(const std::string& name,
                                   const NodeInfo* cached = nullptr);

    /// Store `info` on `node` and patch it into both sub-resources.
    Result<kube::Node> write_node(const kube::Node& node, const NodeInfo& info);

    // ── Pods ─────────────────────────────────
    Result<ObservedPod> read_pod(const std::string& namespace_,
                                 const std::string& name,
                                 bool invalidate);

    /// Store `info` on `pod` with a metadata patch.
    Result<kube::Pod> write_pod(const kube::Pod& pod, const PodInfo& info);

    /**
     * @brief Store `info` on the live copy of `pod` via a restricted update.
     *
     * For callers whose `pod` may be stale in fields the store treats as
     * immutable; only the annotations of the live object are replaced.
     */
    Result<kube::Pod> write_pod_restricted(const kube::Pod& pod, const PodInfo& info);

    [[nodiscard]] const Reconciler& reconciler() const noexcept { return reconciler_; }

private:
    NodeStore& nodes_;
    PodStore& pods_;
    Logger& logger_;
    Reconciler reconciler_;
    UpdateOrchestrator<kube::Node> node_updates_;
    UpdateOrchestrator<kube::Pod> pod_updates_;
};

}  // namespace kube_device
