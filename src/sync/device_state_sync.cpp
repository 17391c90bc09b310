/**
 * @file device_state_sync.cpp
 * @brief DeviceStateSync implementation.
 */

#include "sync/device_state_sync.hpp"

#include "codec/annotation_codec.hpp"

namespace kube_device {

DeviceStateSync::DeviceStateSync(NodeStore& nodes, PodStore& pods, Logger& logger)
    : nodes_(nodes)
    , pods_(pods)
    , logger_(logger)
    , reconciler_(logger)
    , node_updates_(nodes, logger)
    , pod_updates_(pods, logger) {}

Result<ObservedNode> DeviceStateSync::read_node(const std::string& name, const NodeInfo* cached) {
    auto node = nodes_.get(name, {});
    if (!node) return node.error();

    auto info = reconciler_.reconcile_node(*node, cached);
    if (!info) {
        return info.error().wrap(info.error().code, "reading node " + name);
    }
    return ObservedNode{std::move(*node), std::move(*info)};
}

Result<kube::Node> DeviceStateSync::write_node(const kube::Node& node, const NodeInfo& info) {
    kube::Node updated = node;
    if (auto written = AnnotationCodec::write(updated.metadata, info); !written) {
        logger_.error("Encoding device info for node " + node.metadata.name + " failed: "
                      + written.error().message);
        return written.error();
    }
    logger_.v(4, "NodeInfo for " + node.metadata.name + " converted to annotation");
    return node_updates_.patch_metadata_and_status(node.metadata.name, node, updated);
}

Result<ObservedPod> DeviceStateSync::read_pod(const std::string& namespace_,
                                              const std::string& name,
                                              bool invalidate) {
    auto pod = pods_.get(name, namespace_);
    if (!pod) return pod.error();

    auto info = reconciler_.reconcile_pod(*pod, invalidate);
    if (!info) {
        return info.error().wrap(info.error().code,
                                 "reading pod " + namespace_ + "/" + name);
    }
    return ObservedPod{std::move(*pod), std::move(*info)};
}

Result<kube::Pod> DeviceStateSync::write_pod(const kube::Pod& pod, const PodInfo& info) {
    kube::Pod updated = pod;
    if (auto written = AnnotationCodec::write(updated.metadata, info); !written) {
        logger_.error("Encoding device info for pod " + pod.metadata.name + " failed: "
                      + written.error().message);
        return written.error();
    }
    logger_.v(4, "PodInfo for " + pod.metadata.name + " converted to annotation");
    return pod_updates_.patch_metadata(pod.metadata.name, pod, updated);
}

Result<kube::Pod> DeviceStateSync::write_pod_restricted(const kube::Pod& pod,
                                                        const PodInfo& info) {
    kube::Pod desired = pod;
    if (auto written = AnnotationCodec::write(desired.metadata, info); !written) {
        logger_.error("Encoding device info for pod " + pod.metadata.name + " failed: "
                      + written.error().message);
        return written.error();
    }
    return pod_updates_.update_metadata_only(desired);
}

}  // namespace kube_device
