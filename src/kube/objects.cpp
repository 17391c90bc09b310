/**
 * @file objects.cpp
 * @brief JSON conversion for orchestrator objects.
 */

#include "kube/objects.hpp"
#include "core/json_fields.hpp"

#include <stdexcept>

namespace kube_device {

void to_json(nlohmann::json& j, const Quantity& q) {
    j = q.string();
}

void from_json(const nlohmann::json& j, Quantity& q) {
    Result<Quantity> parsed = j.is_string()
        ? Quantity::parse(j.get_ref<const std::string&>())
        : (j.is_number_integer() ? Result<Quantity>{Quantity::from_int(j.get<int64_t>())}
                                 : Quantity::parse(j.dump()));
    if (!parsed) {
        throw std::invalid_argument(parsed.error().message);
    }
    q = std::move(*parsed);
}

}  // namespace kube_device

namespace kube_device::kube {

namespace {

using nlohmann::json;

void write_string(json& j, const char* key, const std::string& value) {
    if (!value.empty()) j[key] = value;
}

template <typename MapT>
void write_map(json& j, const char* key, const MapT& value) {
    if (!value.empty()) j[key] = value;
}

}  // namespace

void to_json(json& j, const ObjectMeta& meta) {
    j = json::object();
    write_string(j, "name", meta.name);
    write_string(j, "namespace", meta.namespace_);
    write_string(j, "uid", meta.uid);
    write_string(j, "resourceVersion", meta.resource_version);
    write_map(j, "labels", meta.labels);
    write_map(j, "annotations", meta.annotations);
}

void from_json(const json& j, ObjectMeta& meta) {
    require_object(j, "metadata");
    read_field(j, "name", meta.name);
    read_field(j, "namespace", meta.namespace_);
    read_field(j, "uid", meta.uid);
    read_field(j, "resourceVersion", meta.resource_version);
    read_field(j, "labels", meta.labels);
    read_field(j, "annotations", meta.annotations);
}

void to_json(json& j, const ResourceRequirements& res) {
    j = json::object();
    write_map(j, "requests", res.requests);
    write_map(j, "limits", res.limits);
}

void from_json(const json& j, ResourceRequirements& res) {
    require_object(j, "resources");
    read_field(j, "requests", res.requests);
    read_field(j, "limits", res.limits);
}

void to_json(json& j, const Container& c) {
    j = json::object();
    j["name"] = c.name;
    write_string(j, "image", c.image);
    j["resources"] = c.resources;
}

void from_json(const json& j, Container& c) {
    require_object(j, "container");
    read_field(j, "name", c.name);
    read_field(j, "image", c.image);
    read_field(j, "resources", c.resources);
}

void to_json(json& j, const PodSpec& spec) {
    j = json::object();
    write_string(j, "nodeName", spec.node_name);
    write_string(j, "schedulerName", spec.scheduler_name);
    if (!spec.init_containers.empty()) j["initContainers"] = spec.init_containers;
    j["containers"] = spec.containers;
}

void from_json(const json& j, PodSpec& spec) {
    require_object(j, "pod spec");
    read_field(j, "nodeName", spec.node_name);
    read_field(j, "schedulerName", spec.scheduler_name);
    read_field(j, "initContainers", spec.init_containers);
    read_field(j, "containers", spec.containers);
}

void to_json(json& j, const PodStatus& status) {
    j = json::object();
    write_string(j, "phase", status.phase);
    write_string(j, "hostIP", status.host_ip);
}

void from_json(const json& j, PodStatus& status) {
    require_object(j, "pod status");
    read_field(j, "phase", status.phase);
    read_field(j, "hostIP", status.host_ip);
}

void to_json(json& j, const Pod& pod) {
    j = json{{"metadata", pod.metadata}, {"spec", pod.spec}, {"status", pod.status}};
}

void from_json(const json& j, Pod& pod) {
    require_object(j, "pod");
    read_field(j, "metadata", pod.metadata);
    read_field(j, "spec", pod.spec);
    read_field(j, "status", pod.status);
}

void to_json(json& j, const NodeSpec& spec) {
    j = json::object();
    write_string(j, "providerID", spec.provider_id);
    if (spec.unschedulable) j["unschedulable"] = true;
}

void from_json(const json& j, NodeSpec& spec) {
    require_object(j, "node spec");
    read_field(j, "providerID", spec.provider_id);
    read_field(j, "unschedulable", spec.unschedulable);
}

void to_json(json& j, const NodeStatus& status) {
    j = json::object();
    write_map(j, "capacity", status.capacity);
    write_map(j, "allocatable", status.allocatable);
}

void from_json(const json& j, NodeStatus& status) {
    require_object(j, "node status");
    read_field(j, "capacity", status.capacity);
    read_field(j, "allocatable", status.allocatable);
}

void to_json(json& j, const Node& node) {
    j = json{{"metadata", node.metadata}, {"spec", node.spec}, {"status", node.status}};
}

void from_json(const json& j, Node& node) {
    require_object(j, "node");
    read_field(j, "metadata", node.metadata);
    read_field(j, "spec", node.spec);
    read_field(j, "status", node.status);
}

}  // namespace kube_device::kube
