/**
 * @file objects.hpp
 * @brief Orchestrator Node and Pod objects and their canonical JSON form.
 *
 * Only the fields this library reads or must carry through a restricted
 * update unchanged are modelled. JSON conversion follows the orchestrator's
 * conventions: camelCase keys, empty fields omitted, unknown keys ignored.
 */

#pragma once

#include "core/quantity.hpp"
#include "core/result.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace kube_device::kube {

using StringMap = std::map<std::string, std::string>;

// ─────────────────────────────────────────────
// Metadata
// ─────────────────────────────────────────────

struct ObjectMeta {
    std::string name;
    std::string namespace_;
    std::string uid;
    std::string resource_version;
    StringMap labels;
    StringMap annotations;

    bool operator==(const ObjectMeta&) const = default;
};

// ─────────────────────────────────────────────
// Pod
// ─────────────────────────────────────────────

struct ResourceRequirements {
    ResourceQuantities requests;
    ResourceQuantities limits;

    bool operator==(const ResourceRequirements&) const = default;
};

struct Container {
    std::string name;
    std::string image;
    ResourceRequirements resources;

    bool operator==(const Container&) const = default;
};

struct PodSpec {
    std::string node_name;           ///< Orchestrator binding; immutable once set
    std::string scheduler_name;
    std::vector<Container> init_containers;
    std::vector<Container> containers;

    bool operator==(const PodSpec&) const = default;
};

struct PodStatus {
    std::string phase;
    std::string host_ip;

    bool operator==(const PodStatus&) const = default;
};

struct Pod {
    ObjectMeta metadata;
    PodSpec spec;
    PodStatus status;

    bool operator==(const Pod&) const = default;
};

// ─────────────────────────────────────────────
// Node
// ─────────────────────────────────────────────

struct NodeSpec {
    std::string provider_id;
    bool unschedulable{false};

    bool operator==(const NodeSpec&) const = default;
};

struct NodeStatus {
    ResourceQuantities capacity;
    ResourceQuantities allocatable;

    bool operator==(const NodeStatus&) const = default;
};

struct Node {
    ObjectMeta metadata;
    NodeSpec spec;
    NodeStatus status;

    bool operator==(const Node&) const = default;
};

// ─────────────────────────────────────────────
// JSON (ADL hooks for nlohmann::json)
// ─────────────────────────────────────────────

void to_json(nlohmann::json& j, const ObjectMeta& meta);
void from_json(const nlohmann::json& j, ObjectMeta& meta);
void to_json(nlohmann::json& j, const ResourceRequirements& res);
void from_json(const nlohmann::json& j, ResourceRequirements& res);
void to_json(nlohmann::json& j, const Container& c);
void from_json(const nlohmann::json& j, Container& c);
void to_json(nlohmann::json& j, const PodSpec& spec);
void from_json(const nlohmann::json& j, PodSpec& spec);
void to_json(nlohmann::json& j, const PodStatus& status);
void from_json(const nlohmann::json& j, PodStatus& status);
void to_json(nlohmann::json& j, const Pod& pod);
void from_json(const nlohmann::json& j, Pod& pod);
void to_json(nlohmann::json& j, const NodeSpec& spec);
void from_json(const nlohmann::json& j, NodeSpec& spec);
void to_json(nlohmann::json& j, const NodeStatus& status);
void from_json(const nlohmann::json& j, NodeStatus& status);
void to_json(nlohmann::json& j, const Node& node);
void from_json(const nlohmann::json& j, Node& node);

/**
 * @brief Decode an object from JSON, reporting failures as `code`.
 */
template <typename ObjectT>
Result<ObjectT> object_from_json(const nlohmann::json& j,
                                 ErrorCode code = ErrorCode::DeserializationError) {
    try {
        return j.get<ObjectT>();
    } catch (const std::exception& e) {
        // nlohmann type errors and invalid quantities alike
        return Error{code, std::string{"malformed object: "} + e.what()};
    }
}

/**
 * @brief Parse and decode an object from JSON text.
 */
template <typename ObjectT>
Result<ObjectT> object_from_string(std::string_view text) {
    auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return Error{ErrorCode::DeserializationError, "object is not valid JSON"};
    }
    return object_from_json<ObjectT>(j);
}

}  // namespace kube_device::kube

namespace kube_device {

void to_json(nlohmann::json& j, const Quantity& q);
void from_json(const nlohmann::json& j, Quantity& q);

}  // namespace kube_device
