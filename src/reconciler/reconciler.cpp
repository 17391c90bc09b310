/**
 * @file reconciler.cpp
 * @brief Reconciler implementation.
 */

#include "reconciler/reconciler.hpp"

#include "codec/annotation_codec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace kube_device {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

template <typename ModelT>
std::string describe(const ModelT& info) {
    return nlohmann::json(info).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void copy_quantities(const ResourceQuantities& from, ResourceList& to) {
    for (const auto& [name, quantity] : from) {
        to[ResourceName{name}] = quantity.value();
    }
}

}  // namespace

Reconciler::Reconciler(Logger& logger) : logger_(logger) {}

Result<NodeInfo> Reconciler::reconcile_node_annotation(const kube::ObjectMeta& meta,
                                                       const NodeInfo* existing) const {
    auto decoded = AnnotationCodec::read_node_info(meta);
    if (!decoded) {
        logger_.error("Node " + meta.name + ": " + decoded.error().message);
        return decoded.error();
    }

    NodeInfo info = std::move(*decoded);
    if (is_blank(info.name)) {
        info.name = meta.name;
    }
    if (existing != nullptr) {
        for (const auto& [resource, used] : existing->used) {
            info.used[resource] = used;
        }
    }

    if (logger_.enabled(4)) {
        logger_.v(4, "Annotations of node " + meta.name + " converted to NodeInfo: "
                     + describe(info));
    }
    return info;
}

Result<NodeInfo> Reconciler::reconcile_node(const kube::Node& node,
                                            const NodeInfo* existing) const {
    auto info = reconcile_node_annotation(node.metadata, existing);
    if (!info) return info;

    copy_quantities(node.status.capacity, info->kube_cap);
    copy_quantities(node.status.allocatable, info->kube_alloc);
    return info;
}

Result<PodInfo> Reconciler::reconcile_pod(const kube::Pod& pod, bool invalidate) const {
    auto decoded = AnnotationCodec::read_pod_info(pod.metadata);
    if (!decoded) {
        logger_.error("Pod " + pod.metadata.namespace_ + "/" + pod.metadata.name + ": "
                      + decoded.error().message);
        return decoded.error();
    }

    PodInfo info = std::move(*decoded);
    info.name = pod.metadata.name;

    merge_declared_requests(info.init_containers, pod.spec.init_containers);
    merge_declared_requests(info.running_containers, pod.spec.containers);

    if (invalidate) {
        Reconciler::invalidate(info);
    }

    if (logger_.enabled(4)) {
        logger_.v(4, "Pod " + pod.metadata.namespace_ + "/" + pod.metadata.name
                     + " converted to device scheduler pod info: " + describe(info));
    }
    return info;
}

void Reconciler::invalidate(PodInfo& info) {
    for (auto* containers : {&info.init_containers, &info.running_containers}) {
        for (auto& [name, container] : *containers) {
            container.allocate_from.clear();
            container.dev_requests = container.requests;
        }
    }
    info.node_name.clear();
}

void Reconciler::merge_declared_requests(ContainerMap& containers,
                                         const std::vector<kube::Container>& declared) {
    for (const auto& c : declared) {
        // operator[] materializes a zero-valued ContainerInfo when absent
        ContainerInfo& info = containers[c.name];
        copy_quantities(c.resources.requests, info.kube_requests);
    }
}

}  // namespace kube_device
