/**
 * @file annotation_codec.cpp
 * @brief JSON encoding of the device model and annotation helpers.
 */

#include "codec/annotation_codec.hpp"
#include "core/json_fields.hpp"

#include <stdexcept>

namespace kube_device {

namespace {

using nlohmann::json;

template <typename T>
void write_field(json& j, const char* key, const T& value) {
    if (!value.empty()) j[key] = value;
}

template <typename ModelT>
Result<std::string> encode_model(const ModelT& info) {
    try {
        return json(info).dump();
    } catch (const json::exception& e) {
        return Error{ErrorCode::SerializationError,
                     std::string{"failed to encode device info: "} + e.what()};
    }
}

template <typename ModelT>
Result<ModelT> decode_model(std::string_view value) {
    auto j = json::parse(value, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return Error{ErrorCode::DeserializationError,
                     "device info annotation is not valid JSON"};
    }
    if (!j.is_object()) {
        return Error{ErrorCode::DeserializationError,
                     "device info annotation is not a JSON object"};
    }
    try {
        return j.get<ModelT>();
    } catch (const json::exception& e) {
        return Error{ErrorCode::DeserializationError,
                     std::string{"malformed device info annotation: "} + e.what()};
    } catch (const std::invalid_argument& e) {
        return Error{ErrorCode::DeserializationError,
                     std::string{"malformed device info annotation: "} + e.what()};
    }
}

template <typename ModelT>
Result<void> write_model(kube::ObjectMeta& meta, const ModelT& info) {
    auto encoded = encode_model(info);
    if (!encoded) return encoded.error();
    meta.annotations[std::string{kDeviceInfoAnnotation}] = std::move(*encoded);
    return {};
}

template <typename ModelT>
Result<ModelT> read_model(const kube::ObjectMeta& meta) {
    auto it = meta.annotations.find(std::string{kDeviceInfoAnnotation});
    if (it == meta.annotations.end()) return ModelT{};
    return decode_model<ModelT>(it->second);
}

}  // namespace

// ── JSON ─────────────────────────────────────

void to_json(json& j, const ContainerInfo& info) {
    j = json::object();
    write_field(j, "kuberequests", info.kube_requests);
    write_field(j, "requests", info.requests);
    write_field(j, "devrequests", info.dev_requests);
    write_field(j, "allocatefrom", info.allocate_from);
    write_field(j, "scorer", info.scorer);
}

void from_json(const json& j, ContainerInfo& info) {
    require_object(j, "container info");
    read_integer_map(j, "kuberequests", info.kube_requests);
    read_integer_map(j, "requests", info.requests);
    read_integer_map(j, "devrequests", info.dev_requests);
    read_field(j, "allocatefrom", info.allocate_from);
    read_integer_map(j, "scorer", info.scorer);
}

void to_json(json& j, const NodeInfo& info) {
    j = json::object();
    if (!info.name.empty()) j["name"] = info.name;
    write_field(j, "capacity", info.capacity);
    write_field(j, "allocatable", info.allocatable);
    write_field(j, "used", info.used);
    write_field(j, "scorer", info.scorer);
    write_field(j, "kubecap", info.kube_cap);
    write_field(j, "kubealloc", info.kube_alloc);
}

void from_json(const json& j, NodeInfo& info) {
    require_object(j, "node info");
    read_field(j, "name", info.name);
    read_integer_map(j, "capacity", info.capacity);
    read_integer_map(j, "allocatable", info.allocatable);
    read_integer_map(j, "used", info.used);
    read_integer_map(j, "scorer", info.scorer);
    read_integer_map(j, "kubecap", info.kube_cap);
    read_integer_map(j, "kubealloc", info.kube_alloc);
}

void to_json(json& j, const PodInfo& info) {
    j = json::object();
    if (!info.name.empty()) j["podname"] = info.name;
    if (!info.node_name.empty()) j["nodename"] = info.node_name;
    write_field(j, "requests", info.requests);
    write_field(j, "initcontainer", info.init_containers);
    write_field(j, "runningcontainer", info.running_containers);
}

void from_json(const json& j, PodInfo& info) {
    require_object(j, "pod info");
    read_field(j, "podname", info.name);
    read_field(j, "nodename", info.node_name);
    read_integer_map(j, "requests", info.requests);
    read_field(j, "initcontainer", info.init_containers);
    read_field(j, "runningcontainer", info.running_containers);
}

// ── AnnotationCodec ──────────────────────────

Result<std::string> AnnotationCodec::encode(const NodeInfo& info) { return encode_model(info); }
Result<std::string> AnnotationCodec::encode(const PodInfo& info)  { return encode_model(info); }

Result<NodeInfo> AnnotationCodec::decode_node_info(std::string_view value) {
    return decode_model<NodeInfo>(value);
}

Result<PodInfo> AnnotationCodec::decode_pod_info(std::string_view value) {
    return decode_model<PodInfo>(value);
}

Result<void> AnnotationCodec::write(kube::ObjectMeta& meta, const NodeInfo& info) {
    return write_model(meta, info);
}

Result<void> AnnotationCodec::write(kube::ObjectMeta& meta, const PodInfo& info) {
    return write_model(meta, info);
}

Result<NodeInfo> AnnotationCodec::read_node_info(const kube::ObjectMeta& meta) {
    return read_model<NodeInfo>(meta);
}

Result<PodInfo> AnnotationCodec::read_pod_info(const kube::ObjectMeta& meta) {
    return read_model<PodInfo>(meta);
}

}  // namespace kube_device
