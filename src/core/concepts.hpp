/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for KubeDeviceSync interfaces.
 *
 * Defines compile-time constraints for the generic store and update code,
 * which works on any orchestrator object kind that has ObjectTraits.
 */

#pragma once

#include "core/result.hpp"

#include <concepts>
#include <string>
#include <string_view>

namespace kube_device {

// Forward declarations
class FieldSchema;
namespace kube {
template <typename ObjectT>
struct ObjectTraits;
}  // namespace kube

// ─────────────────────────────────────────────
// KubeObject
// ─────────────────────────────────────────────

/**
 * @concept KubeObject
 * @brief Orchestrator object with metadata, canonical JSON and ObjectTraits.
 */
template <typename T>
concept KubeObject = std::copyable<T> && std::default_initializable<T>
    && requires(T obj, const T& cobj) {
    { obj.metadata.name } -> std::convertible_to<std::string>;
    { obj.metadata.namespace_ } -> std::convertible_to<std::string>;
    { obj.metadata.resource_version } -> std::convertible_to<std::string>;
    obj.metadata.annotations = cobj.metadata.annotations;
    { kube::ObjectTraits<T>::kind() } -> std::convertible_to<std::string_view>;
    { kube::ObjectTraits<T>::schema() } -> std::same_as<const FieldSchema&>;
    { kube::ObjectTraits<T>::validate_update(cobj, cobj) } -> std::same_as<Result<void>>;
};

}  // namespace kube_device
