/**
 * @file schema.cpp
 * @brief FieldSchema builders.
 */

#include "patch/schema.hpp"

#include <utility>

namespace kube_device {

FieldSchema FieldSchema::atomic() {
    FieldSchema schema;
    schema.strategy_ = MergeStrategy::Replace;
    return schema;
}

FieldSchema FieldSchema::list_by_key(std::string merge_key, FieldSchema element) {
    element.strategy_ = MergeStrategy::MergeByKey;
    element.merge_key_ = std::move(merge_key);
    return element;
}

FieldSchema& FieldSchema::with(std::string name, FieldSchema child) {
    children_[std::move(name)] = std::make_shared<const FieldSchema>(std::move(child));
    return *this;
}

const FieldSchema& FieldSchema::child(std::string_view name) const {
    static const FieldSchema kDefault{};
    auto it = children_.find(name);
    return it == children_.end() ? kDefault : *it->second;
}

}  // namespace kube_device
