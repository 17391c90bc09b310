/**
 * @file annotation_codec.hpp
 * @brief Private device model <-> annotation value.
 *
 * The whole NodeInfo/PodInfo travels as compact JSON under one reserved
 * annotation key. Decoding ignores unknown fields and treats null fields as
 * absent, so writers of older and newer model versions can share an object.
 *
 * JSON layout:
 *   NodeInfo      {"name","capacity","allocatable","used","scorer","kubecap","kubealloc"}
 *   PodInfo       {"podname","nodename","requests","initcontainer","runningcontainer"}
 *   ContainerInfo {"kuberequests","requests","devrequests","allocatefrom","scorer"}
 * Empty fields are omitted.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "kube/objects.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace kube_device {

/// Reserved annotation key shared by every reader and writer of device state.
inline constexpr std::string_view kDeviceInfoAnnotation = "KubeDevice/DeviceInfo";

struct AnnotationCodec {
    [[nodiscard]] static Result<std::string> encode(const NodeInfo& info);
    [[nodiscard]] static Result<std::string> encode(const PodInfo& info);

    [[nodiscard]] static Result<NodeInfo> decode_node_info(std::string_view value);
    [[nodiscard]] static Result<PodInfo> decode_pod_info(std::string_view value);

    /// Store the encoded model under kDeviceInfoAnnotation; other annotations are kept.
    static Result<void> write(kube::ObjectMeta& meta, const NodeInfo& info);
    static Result<void> write(kube::ObjectMeta& meta, const PodInfo& info);

    /// Decode from `meta`; a missing annotation yields an empty model.
    [[nodiscard]] static Result<NodeInfo> read_node_info(const kube::ObjectMeta& meta);
    [[nodiscard]] static Result<PodInfo> read_pod_info(const kube::ObjectMeta& meta);
};

// ADL hooks for nlohmann::json
void to_json(nlohmann::json& j, const ContainerInfo& info);
void from_json(const nlohmann::json& j, ContainerInfo& info);
void to_json(nlohmann::json& j, const NodeInfo& info);
void from_json(const nlohmann::json& j, NodeInfo& info);
void to_json(nlohmann::json& j, const PodInfo& info);
void from_json(const nlohmann::json& j, PodInfo& info);

}  // namespace kube_device
