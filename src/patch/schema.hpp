/**
 * @file schema.hpp
 * @brief Per-field merge strategies used by the strategic merge patch.
 *
 * A schema only needs to describe the exceptions. Without an entry, JSON
 * objects merge recursively and everything else (scalars, lists) is
 * replaced wholesale.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace kube_device {

enum class MergeStrategy : uint8_t {
    Merge,       ///< Objects: recurse field by field
    Replace,     ///< Replace the whole value on any difference
    MergeByKey   ///< Lists of objects identified by a merge key
};

/**
 * @brief Merge strategy for one field plus the schemas of its children.
 *
 * For MergeByKey fields the children describe the list element's fields.
 */
class FieldSchema {
public:
    FieldSchema() = default;

    [[nodiscard]] static FieldSchema object() { return FieldSchema{}; }
    [[nodiscard]] static FieldSchema atomic();
    [[nodiscard]] static FieldSchema list_by_key(std::string merge_key,
                                                 FieldSchema element = FieldSchema::object());

    /// Builder: declare the schema of child `name`.
    FieldSchema& with(std::string name, FieldSchema child);

    [[nodiscard]] MergeStrategy strategy() const noexcept { return strategy_; }
    [[nodiscard]] const std::string& merge_key() const noexcept { return merge_key_; }

    /// Schema of child `name`, or the default schema when undeclared.
    [[nodiscard]] const FieldSchema& child(std::string_view name) const;

private:
    MergeStrategy strategy_{MergeStrategy::Merge};
    std::string merge_key_;
    std::map<std::string, std::shared_ptr<const FieldSchema>, std::less<>> children_;
};

}  // namespace kube_device
