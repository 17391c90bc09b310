/**
 * @file object_traits.hpp
 * @brief Per-kind facts about orchestrator objects.
 *
 * ObjectTraits<T> tells the generic store and update code what a kind is
 * called, how its fields merge, which of its fields are immutable and which
 * part of the object each sub-resource is allowed to change.
 */

#pragma once

#include "core/result.hpp"
#include "kube/objects.hpp"
#include "patch/schema.hpp"

#include <cstdint>
#include <string_view>

namespace kube_device {

/**
 * @brief Independently versioned facet of an object.
 *
 * Main covers metadata and spec; Status covers metadata and status.
 */
enum class SubResource : uint8_t {
    Main,
    Status
};

[[nodiscard]] constexpr std::string_view to_string(SubResource sub) noexcept {
    switch (sub) {
        case SubResource::Main:   return "main";
        case SubResource::Status: return "status";
    }
    return "unknown";
}

}  // namespace kube_device

namespace kube_device::kube {

template <typename ObjectT>
struct ObjectTraits;

template <>
struct ObjectTraits<Node> {
    static constexpr std::string_view kind() noexcept { return "node"; }
    static constexpr bool namespaced() noexcept { return false; }

    static const FieldSchema& schema();

    /// Reset the parts of `updated` that `sub` may not change.
    static void restrict_to(SubResource sub, const Node& current, Node& updated);

    static Result<void> validate_update(const Node& current, const Node& updated);
};

template <>
struct ObjectTraits<Pod> {
    static constexpr std::string_view kind() noexcept { return "pod"; }
    static constexpr bool namespaced() noexcept { return true; }

    static const FieldSchema& schema();

    static void restrict_to(SubResource sub, const Pod& current, Pod& updated);

    /// spec.nodeName is immutable once bound; containers are immutable.
    static Result<void> validate_update(const Pod& current, const Pod& updated);
};

}  // namespace kube_device::kube
