/**
 * @file object_store.hpp
 * @brief Remote object store interface (one instance per object kind).
 *
 * This is the boundary to the orchestrator's API server. Implementations
 * perform exactly one request per call and report failures through Result;
 * they never retry.
 */

#pragma once

#include "core/result.hpp"
#include "kube/object_traits.hpp"
#include "kube/objects.hpp"

#include <string>
#include <string_view>

namespace kube_device {

/**
 * @brief Abstract interface to the orchestrator's store for one kind.
 *
 * Virtual dispatch is fine here: every call is a network round trip.
 */
template <typename ObjectT>
class IObjectStore {
public:
    virtual ~IObjectStore() = default;

    /// Fetch by name (+ namespace for namespaced kinds). NotFound if absent.
    virtual Result<ObjectT> get(const std::string& name, const std::string& namespace_) = 0;

    /// Apply strategic-merge `patch_bytes` to one sub-resource.
    virtual Result<ObjectT> patch(const std::string& name,
                                  const std::string& namespace_,
                                  std::string_view patch_bytes,
                                  SubResource sub_resource = SubResource::Main) = 0;

    /// Replace the whole object. Conflict if its resourceVersion is stale.
    virtual Result<ObjectT> update(const ObjectT& object) = 0;
};

using NodeStore = IObjectStore<kube::Node>;
using PodStore = IObjectStore<kube::Pod>;

}  // namespace kube_device
