/**
 * @file patch_builder.hpp
 * @brief Two-way strategic merge patch: diff and apply.
 *
 * The diff produces the smallest document that turns the original into the
 * modified object under strategic-merge semantics:
 *
 *   - a key missing from the modified object becomes null (delete);
 *   - objects recurse, so untouched siblings never appear in the patch;
 *   - lists declared MergeByKey emit only changed or added elements, each
 *     carrying its merge key, plus {"<key>": k, "$patch": "delete"} entries
 *     for removed elements;
 *   - everything else is replaced when it differs.
 *
 * Applying that patch onto a remote copy that has since gained unrelated
 * fields leaves those fields alone.
 */

#pragma once

#include "core/result.hpp"
#include "patch/schema.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <string>
#include <string_view>

namespace kube_device {

using PatchDocument = nlohmann::json;

inline constexpr std::string_view kPatchDirective = "$patch";
inline constexpr std::string_view kPatchDelete = "delete";

/**
 * @brief Diff two canonical JSON objects against `schema`.
 *
 * Fails with DiffError when either side is not a JSON object or a keyed
 * list element lacks its merge key.
 */
Result<PatchDocument> create_two_way_merge_patch(const nlohmann::json& original,
                                                 const nlohmann::json& modified,
                                                 const FieldSchema& schema);

/**
 * @brief Apply a strategic merge patch to `original`.
 *
 * Fails with PatchApplyError when the patch is not an object or a keyed
 * list entry lacks its merge key.
 */
Result<nlohmann::json> apply_strategic_merge_patch(const nlohmann::json& original,
                                                   const PatchDocument& patch,
                                                   const FieldSchema& schema);

/**
 * @brief Serialize two typed objects and diff them.
 *
 * Both objects must convert to JSON and dump to valid UTF-8 text; anything
 * else is a DiffError naming `resource_name`.
 */
template <typename ObjectT>
Result<PatchDocument> build_patch(std::string_view resource_name,
                                  const ObjectT& old_object,
                                  const ObjectT& new_object,
                                  const FieldSchema& schema) {
    auto serialize = [&](const ObjectT& obj, std::string_view which) -> Result<nlohmann::json> {
        try {
            nlohmann::json j = obj;
            (void)j.dump();
            return j;
        } catch (const std::exception& e) {
            return Error{ErrorCode::DiffError,
                         "failed to marshal " + std::string{which} + " resource "
                         + std::string{resource_name} + ": " + e.what()};
        }
    };

    auto old_json = serialize(old_object, "old");
    if (!old_json) return old_json.error();
    auto new_json = serialize(new_object, "new");
    if (!new_json) return new_json.error();

    auto patch = create_two_way_merge_patch(*old_json, *new_json, schema);
    if (!patch) {
        return patch.error().wrap(ErrorCode::DiffError,
                                  "failed to create patch for resource "
                                  + std::string{resource_name});
    }
    return patch;
}

}  // namespace kube_device
