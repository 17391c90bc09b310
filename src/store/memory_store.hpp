/**
 * @file memory_store.hpp
 * @brief In-memory IObjectStore with API-server semantics.
 *
 * Models what the sync code relies on from the real store:
 *   - strategic merge patches applied per sub-resource (Main keeps status,
 *     Status keeps spec);
 *   - optimistic concurrency on update via resourceVersion;
 *   - kind-specific immutable-field validation;
 *   - no resourceVersion bump for no-op writes.
 *
 * Also records every call and supports injected failures, so it doubles as
 * the test fixture for the update paths.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "kube/object_traits.hpp"
#include "patch/patch_builder.hpp"
#include "store/object_store.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace kube_device {

enum class StoreOp : uint8_t {
    Get,
    Patch,
    Update
};

/**
 * @brief One recorded store call.
 */
struct StoreCall {
    StoreOp op;
    std::string name;
    std::string namespace_;
    SubResource sub_resource{SubResource::Main};
    std::string patch_bytes;                 ///< Patch calls only
};

template <KubeObject ObjectT>
class InMemoryObjectStore : public IObjectStore<ObjectT> {
public:
    using Traits = kube::ObjectTraits<ObjectT>;

    InMemoryObjectStore() = default;

    // Non-copyable
    InMemoryObjectStore(const InMemoryObjectStore&) = delete;
    InMemoryObjectStore& operator=(const InMemoryObjectStore&) = delete;

    // ── IObjectStore ─────────────────────────
    Result<ObjectT> get(const std::string& name, const std::string& namespace_) override;
    Result<ObjectT> patch(const std::string& name,
                          const std::string& namespace_,
                          std::string_view patch_bytes,
                          SubResource sub_resource = SubResource::Main) override;
    Result<ObjectT> update(const ObjectT& object) override;

    // ── Seeding and test helpers ─────────────
    Result<ObjectT> create(ObjectT object);

    /// Simulate a concurrent writer: mutate the stored object and bump its version.
    Result<ObjectT> mutate(const std::string& name, const std::string& namespace_,
                           const std::function<void(ObjectT&)>& fn);

    /// Make the next matching call fail with `error` before touching state.
    void inject_failure(StoreOp op, Error error,
                        std::optional<SubResource> sub_resource = std::nullopt);

    [[nodiscard]] std::vector<StoreCall> calls() const;
    void clear_calls();
    [[nodiscard]] size_t size() const;

private:
    struct Injected {
        StoreOp op;
        std::optional<SubResource> sub_resource;
        Error error;
    };

    static std::string key_of(const std::string& name, const std::string& namespace_);
    static std::string describe(const std::string& name);
    std::optional<Error> take_failure(StoreOp op, SubResource sub);
    void bump(ObjectT& object);

    mutable std::shared_mutex mutex_;
    std::map<std::string, ObjectT> objects_;
    std::deque<Injected> failures_;
    std::vector<StoreCall> calls_;
    uint64_t next_version_{1};
    uint64_t next_uid_{1};
};

using InMemoryNodeStore = InMemoryObjectStore<kube::Node>;
using InMemoryPodStore = InMemoryObjectStore<kube::Pod>;

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <KubeObject ObjectT>
std::string InMemoryObjectStore<ObjectT>::key_of(const std::string& name,
                                                 const std::string& namespace_) {
    if (!Traits::namespaced()) return name;
    return namespace_ + "/" + name;
}

template <KubeObject ObjectT>
std::string InMemoryObjectStore<ObjectT>::describe(const std::string& name) {
    return std::string{Traits::kind()} + "s \"" + name + "\"";
}

template <KubeObject ObjectT>
std::optional<Error> InMemoryObjectStore<ObjectT>::take_failure(StoreOp op, SubResource sub) {
    for (auto it = failures_.begin(); it != failures_.end(); ++it) {
        if (it->op == op && (!it->sub_resource || *it->sub_resource == sub)) {
            Error error = std::move(it->error);
            failures_.erase(it);
            return error;
        }
    }
    return std::nullopt;
}

template <KubeObject ObjectT>
void InMemoryObjectStore<ObjectT>::bump(ObjectT& object) {
    object.metadata.resource_version = std::to_string(next_version_++);
}

template <KubeObject ObjectT>
Result<ObjectT> InMemoryObjectStore<ObjectT>::get(const std::string& name,
                                                  const std::string& namespace_) {
    std::unique_lock lock(mutex_);
    calls_.push_back(StoreCall{StoreOp::Get, name, namespace_, SubResource::Main, {}});
    if (auto failure = take_failure(StoreOp::Get, SubResource::Main)) return *failure;

    auto it = objects_.find(key_of(name, namespace_));
    if (it == objects_.end()) {
        return Error{ErrorCode::NotFound, describe(name) + " not found"};
    }
    return it->second;
}

template <KubeObject ObjectT>
Result<ObjectT> InMemoryObjectStore<ObjectT>::patch(const std::string& name,
                                                    const std::string& namespace_,
                                                    std::string_view patch_bytes,
                                                    SubResource sub_resource) {
    std::unique_lock lock(mutex_);
    calls_.push_back(StoreCall{StoreOp::Patch, name, namespace_, sub_resource,
                               std::string{patch_bytes}});
    if (auto failure = take_failure(StoreOp::Patch, sub_resource)) return *failure;

    auto it = objects_.find(key_of(name, namespace_));
    if (it == objects_.end()) {
        return Error{ErrorCode::NotFound, describe(name) + " not found"};
    }
    const ObjectT& current = it->second;

    auto patch_doc = nlohmann::json::parse(patch_bytes, nullptr, /*allow_exceptions=*/false);
    if (patch_doc.is_discarded()) {
        return Error{ErrorCode::PatchApplyError, "patch for " + describe(name) + " is not JSON"};
    }

    auto patched_json = apply_strategic_merge_patch(nlohmann::json(current), patch_doc,
                                                    Traits::schema());
    if (!patched_json) return patched_json.error();

    auto patched = kube::object_from_json<ObjectT>(*patched_json, ErrorCode::Invalid);
    if (!patched) return patched.error();

    ObjectT updated = std::move(*patched);
    Traits::restrict_to(sub_resource, current, updated);
    updated.metadata.name = current.metadata.name;
    updated.metadata.namespace_ = current.metadata.namespace_;
    updated.metadata.uid = current.metadata.uid;
    updated.metadata.resource_version = current.metadata.resource_version;

    if (auto valid = Traits::validate_update(current, updated); !valid) {
        return valid.error();
    }
    if (updated == current) return current;

    bump(updated);
    it->second = updated;
    return updated;
}

template <KubeObject ObjectT>
Result<ObjectT> InMemoryObjectStore<ObjectT>::update(const ObjectT& object) {
    std::unique_lock lock(mutex_);
    calls_.push_back(StoreCall{StoreOp::Update, object.metadata.name,
                               object.metadata.namespace_, SubResource::Main, {}});
    if (auto failure = take_failure(StoreOp::Update, SubResource::Main)) return *failure;

    auto it = objects_.find(key_of(object.metadata.name, object.metadata.namespace_));
    if (it == objects_.end()) {
        return Error{ErrorCode::NotFound, describe(object.metadata.name) + " not found"};
    }
    const ObjectT& current = it->second;

    if (!object.metadata.resource_version.empty()
        && object.metadata.resource_version != current.metadata.resource_version) {
        return Error{ErrorCode::Conflict,
                     "Operation cannot be fulfilled on " + describe(object.metadata.name)
                     + ": the object has been modified; please apply your changes"
                       " to the latest version and try again"};
    }

    ObjectT updated = object;
    Traits::restrict_to(SubResource::Main, current, updated);
    updated.metadata.uid = current.metadata.uid;
    updated.metadata.resource_version = current.metadata.resource_version;

    if (auto valid = Traits::validate_update(current, updated); !valid) {
        return valid.error();
    }
    if (updated == current) return current;

    bump(updated);
    it->second = updated;
    return updated;
}

template <KubeObject ObjectT>
Result<ObjectT> InMemoryObjectStore<ObjectT>::create(ObjectT object) {
    std::unique_lock lock(mutex_);
    auto key = key_of(object.metadata.name, object.metadata.namespace_);
    if (objects_.count(key) > 0) {
        return Error{ErrorCode::Conflict, describe(object.metadata.name) + " already exists"};
    }
    if (object.metadata.uid.empty()) {
        object.metadata.uid = std::string{Traits::kind()} + "-uid-" + std::to_string(next_uid_++);
    }
    bump(object);
    objects_.emplace(key, object);
    return object;
}

template <KubeObject ObjectT>
Result<ObjectT> InMemoryObjectStore<ObjectT>::mutate(const std::string& name,
                                                     const std::string& namespace_,
                                                     const std::function<void(ObjectT&)>& fn) {
    std::unique_lock lock(mutex_);
    auto it = objects_.find(key_of(name, namespace_));
    if (it == objects_.end()) {
        return Error{ErrorCode::NotFound, describe(name) + " not found"};
    }
    fn(it->second);
    bump(it->second);
    return it->second;
}

template <KubeObject ObjectT>
void InMemoryObjectStore<ObjectT>::inject_failure(StoreOp op, Error error,
                                                  std::optional<SubResource> sub_resource) {
    std::unique_lock lock(mutex_);
    failures_.push_back(Injected{op, sub_resource, std::move(error)});
}

template <KubeObject ObjectT>
std::vector<StoreCall> InMemoryObjectStore<ObjectT>::calls() const {
    std::shared_lock lock(mutex_);
    return calls_;
}

template <KubeObject ObjectT>
void InMemoryObjectStore<ObjectT>::clear_calls() {
    std::unique_lock lock(mutex_);
    calls_.clear();
}

template <KubeObject ObjectT>
size_t InMemoryObjectStore<ObjectT>::size() const {
    std::shared_lock lock(mutex_);
    return objects_.size();
}

}  // namespace kube_device
