/**
 * @file patch_builder.cpp
 * @brief Strategic merge patch diff and apply over nlohmann::json.
 */

#include "patch/patch_builder.hpp"

#include <algorithm>
#include <vector>

namespace kube_device {

namespace {

using nlohmann::json;

bool is_directive(const std::string& key) {
    return !key.empty() && key.front() == '$';
}

// ─────────────────────────────────────────────
// Diff
// ─────────────────────────────────────────────

Result<json> diff_objects(const json& original, const json& modified, const FieldSchema& schema);

Result<json> diff_keyed_list(const json& original, const json& modified,
                             const FieldSchema& schema, const std::string& field) {
    const auto& key = schema.merge_key();
    auto key_of = [&](const json& element) -> const json* {
        if (!element.is_object()) return nullptr;
        auto it = element.find(key);
        return it == element.end() ? nullptr : &*it;
    };

    json patch = json::array();
    std::vector<json> seen;

    for (const auto& element : modified) {
        const json* k = key_of(element);
        if (k == nullptr) {
            return Error{ErrorCode::DiffError,
                         "element of \"" + field + "\" has no merge key \"" + key + "\""};
        }
        seen.push_back(*k);

        const json* previous = nullptr;
        for (const auto& candidate : original) {
            const json* ck = key_of(candidate);
            if (ck != nullptr && *ck == *k) {
                previous = &candidate;
                break;
            }
        }

        if (previous == nullptr) {
            patch.push_back(element);
            continue;
        }
        if (*previous == element) continue;

        auto element_patch = diff_objects(*previous, element, schema);
        if (!element_patch) return element_patch.error();
        (*element_patch)[key] = *k;
        patch.push_back(std::move(*element_patch));
    }

    for (const auto& element : original) {
        const json* k = key_of(element);
        if (k == nullptr) {
            return Error{ErrorCode::DiffError,
                         "element of \"" + field + "\" has no merge key \"" + key + "\""};
        }
        if (std::find(seen.begin(), seen.end(), *k) == seen.end()) {
            patch.push_back(json{{key, *k},
                                 {std::string{kPatchDirective}, std::string{kPatchDelete}}});
        }
    }

    return patch;
}

Result<json> diff_objects(const json& original, const json& modified, const FieldSchema& schema) {
    json patch = json::object();

    for (const auto& [key, value] : original.items()) {
        if (!modified.contains(key)) {
            patch[key] = nullptr;
        }
    }

    for (const auto& [key, value] : modified.items()) {
        auto it = original.find(key);
        if (it == original.end()) {
            patch[key] = value;
            continue;
        }
        if (*it == value) continue;

        const auto& child = schema.child(key);
        if (it->is_object() && value.is_object() && child.strategy() == MergeStrategy::Merge) {
            auto sub = diff_objects(*it, value, child);
            if (!sub) return sub.error();
            if (!sub->empty()) patch[key] = std::move(*sub);
        } else if (it->is_array() && value.is_array()
                   && child.strategy() == MergeStrategy::MergeByKey) {
            auto sub = diff_keyed_list(*it, value, child, key);
            if (!sub) return sub.error();
            // Pure reordering of a keyed list carries no information.
            if (!sub->empty()) patch[key] = std::move(*sub);
        } else {
            patch[key] = value;
        }
    }

    return patch;
}

// ─────────────────────────────────────────────
// Apply
// ─────────────────────────────────────────────

json strip_directives(const json& value) {
    if (!value.is_object()) return value;
    json out = json::object();
    for (const auto& [key, child] : value.items()) {
        if (is_directive(key)) continue;
        if (child.is_null()) continue;
        out[key] = strip_directives(child);
    }
    return out;
}

Result<void> apply_object(json& target, const json& patch, const FieldSchema& schema);

Result<void> apply_keyed_list(json& target, const json& patch,
                              const FieldSchema& schema, const std::string& field) {
    const auto& key = schema.merge_key();
    if (!target.is_array()) target = json::array();

    for (const auto& entry : patch) {
        if (!entry.is_object() || !entry.contains(key)) {
            return Error{ErrorCode::PatchApplyError,
                         "patch entry of \"" + field + "\" has no merge key \"" + key + "\""};
        }
        const auto& k = entry.at(key);

        auto match = target.end();
        for (auto it = target.begin(); it != target.end(); ++it) {
            if (it->is_object() && it->contains(key) && it->at(key) == k) {
                match = it;
                break;
            }
        }

        auto directive = entry.find(std::string{kPatchDirective});
        if (directive != entry.end() && directive->is_string()
            && directive->get_ref<const std::string&>() == kPatchDelete) {
            if (match != target.end()) target.erase(match);
            continue;
        }

        if (match == target.end()) {
            target.push_back(strip_directives(entry));
        } else {
            auto applied = apply_object(*match, entry, schema);
            if (!applied) return applied;
        }
    }
    return {};
}

Result<void> apply_object(json& target, const json& patch, const FieldSchema& schema) {
    if (!target.is_object()) target = json::object();

    for (const auto& [key, value] : patch.items()) {
        if (is_directive(key)) continue;

        if (value.is_null()) {
            target.erase(key);
            continue;
        }

        const auto& child = schema.child(key);
        if (value.is_object() && child.strategy() == MergeStrategy::Merge) {
            auto applied = apply_object(target[key], value, child);
            if (!applied) return applied;
        } else if (value.is_array() && child.strategy() == MergeStrategy::MergeByKey) {
            auto applied = apply_keyed_list(target[key], value, child, key);
            if (!applied) return applied;
        } else {
            target[key] = strip_directives(value);
        }
    }
    return {};
}

}  // namespace

Result<PatchDocument> create_two_way_merge_patch(const nlohmann::json& original,
                                                 const nlohmann::json& modified,
                                                 const FieldSchema& schema) {
    if (!original.is_object() || !modified.is_object()) {
        return Error{ErrorCode::DiffError, "both sides of a patch must be JSON objects"};
    }
    return diff_objects(original, modified, schema);
}

Result<nlohmann::json> apply_strategic_merge_patch(const nlohmann::json& original,
                                                   const PatchDocument& patch,
                                                   const FieldSchema& schema) {
    if (!patch.is_object()) {
        return Error{ErrorCode::PatchApplyError, "patch document must be a JSON object"};
    }
    nlohmann::json result = original;
    auto applied = apply_object(result, patch, schema);
    if (!applied) return applied.error();
    return result;
}

}  // namespace kube_device
