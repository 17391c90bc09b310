/**
 * @file update_orchestrator.hpp
 * @brief Sequences the store calls that write device state back.
 *
 * Two write paths:
 *   1. Patch plans: one strategic merge patch, serialized once, applied to an
 *      ordered list of sub-resources. Steps are independent; a failure stops
 *      the plan and names the failing sub-resource, earlier steps stay applied.
 *   2. Restricted update: fetch the live object, clone it, replace only
 *      metadata.annotations and submit the clone as a full update. Used where
 *      the cached copy differs from the live object in fields the store will
 *      not let change (a pod's spec.nodeName).
 *
 * Store errors are passed through unchanged; nothing is retried here.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "kube/object_traits.hpp"
#include "patch/patch_builder.hpp"
#include "store/object_store.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kube_device {

using PatchPlan = std::vector<SubResource>;

template <KubeObject ObjectT>
class UpdateOrchestrator {
public:
    using Traits = kube::ObjectTraits<ObjectT>;

    UpdateOrchestrator(IObjectStore<ObjectT>& store, Logger& logger)
        : store_(store), logger_(logger) {}

    /// Diff `old_object` -> `new_object` and serialize the patch once.
    Result<std::string> patch_bytes(const std::string& name,
                                    const ObjectT& old_object,
                                    const ObjectT& new_object) const;

    /// Apply the same patch bytes to each sub-resource of `plan`, in order.
    Result<ObjectT> apply_patch_plan(const std::string& name,
                                     const std::string& namespace_,
                                     const std::string& bytes,
                                     const PatchPlan& plan);

    /// Patch the main resource, then the status sub-resource.
    Result<ObjectT> patch_metadata_and_status(const std::string& name,
                                              const ObjectT& old_object,
                                              const ObjectT& new_object);

    /// Patch the main resource only, in the old object's namespace.
    Result<ObjectT> patch_metadata(const std::string& name,
                                   const ObjectT& old_object,
                                   const ObjectT& new_object);

    /// Restricted update: only metadata.annotations of the live object change.
    Result<ObjectT> update_metadata_only(const ObjectT& desired);

private:
    IObjectStore<ObjectT>& store_;
    Logger& logger_;
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <KubeObject ObjectT>
Result<std::string> UpdateOrchestrator<ObjectT>::patch_bytes(const std::string& name,
                                                             const ObjectT& old_object,
                                                             const ObjectT& new_object) const {
    auto patch = build_patch(name, old_object, new_object, Traits::schema());
    if (!patch) {
        logger_.error(patch.error().full_message());
        return patch.error();
    }
    std::string bytes = patch->dump();
    logger_.v(5, "PatchData for " + std::string{Traits::kind()} + " " + name + ": " + bytes);
    return bytes;
}

template <KubeObject ObjectT>
Result<ObjectT> UpdateOrchestrator<ObjectT>::apply_patch_plan(const std::string& name,
                                                              const std::string& namespace_,
                                                              const std::string& bytes,
                                                              const PatchPlan& plan) {
    if (plan.empty()) {
        return Error{ErrorCode::PatchApplyError, "empty patch plan for " + name};
    }

    std::optional<ObjectT> latest;
    for (SubResource sub : plan) {
        auto updated = store_.patch(name, namespace_, bytes, sub);
        if (!updated) {
            Error failure = updated.error().wrap(
                ErrorCode::PatchApplyError,
                "failed to patch " + std::string{to_string(sub)} + " " + bytes
                + " for " + std::string{Traits::kind()} + " \"" + name + "\"");
            failure.sub_resource = std::string{to_string(sub)};
            logger_.error(failure.full_message());
            return failure;
        }
        logger_.v(5, "Patched " + std::string{to_string(sub)} + " of "
                     + std::string{Traits::kind()} + " " + name
                     + " (resourceVersion " + updated->metadata.resource_version + ")");
        latest = std::move(*updated);
    }
    return std::move(*latest);
}

template <KubeObject ObjectT>
Result<ObjectT> UpdateOrchestrator<ObjectT>::patch_metadata_and_status(const std::string& name,
                                                                       const ObjectT& old_object,
                                                                       const ObjectT& new_object) {
    auto bytes = patch_bytes(name, old_object, new_object);
    if (!bytes) return bytes.error();
    return apply_patch_plan(name, old_object.metadata.namespace_, *bytes,
                            PatchPlan{SubResource::Main, SubResource::Status});
}

template <KubeObject ObjectT>
Result<ObjectT> UpdateOrchestrator<ObjectT>::patch_metadata(const std::string& name,
                                                            const ObjectT& old_object,
                                                            const ObjectT& new_object) {
    auto bytes = patch_bytes(name, old_object, new_object);
    if (!bytes) return bytes.error();
    return apply_patch_plan(name, old_object.metadata.namespace_, *bytes,
                            PatchPlan{SubResource::Main});
}

template <KubeObject ObjectT>
Result<ObjectT> UpdateOrchestrator<ObjectT>::update_metadata_only(const ObjectT& desired) {
    const auto& meta = desired.metadata;
    auto live = store_.get(meta.name, meta.namespace_);
    if (!live) return live.error();

    if (live->metadata.name != meta.name || live->metadata.namespace_ != meta.namespace_) {
        Error mismatch{ErrorCode::IdentityMismatch,
                       "new " + std::string{Traits::kind()} + " does not match old, new: "
                       + meta.namespace_ + "/" + meta.name + ", old: "
                       + live->metadata.namespace_ + "/" + live->metadata.name};
        logger_.error(mismatch.message);
        return mismatch;
    }

    ObjectT modified = *live;
    modified.metadata.annotations = meta.annotations;

    auto updated = store_.update(modified);
    if (!updated) {
        logger_.error("Update of " + std::string{Traits::kind()} + " " + meta.name
                      + " failed: " + updated.error().message);
        return updated.error();
    }
    logger_.v(5, "Updated annotations of " + std::string{Traits::kind()} + " " + meta.name
                 + " (resourceVersion " + updated->metadata.resource_version + ")");
    return updated;
}

}  // namespace kube_device
