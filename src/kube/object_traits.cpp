/**
 * @file object_traits.cpp
 * @brief Node and Pod schemas and update validation.
 */

#include "kube/object_traits.hpp"

namespace kube_device::kube {

// ── Node ─────────────────────────────────────

const FieldSchema& ObjectTraits<Node>::schema() {
    static const FieldSchema kSchema = FieldSchema::object()
        .with("metadata", FieldSchema::object())
        .with("spec", FieldSchema::object())
        .with("status", FieldSchema::object());
    return kSchema;
}

void ObjectTraits<Node>::restrict_to(SubResource sub, const Node& current, Node& updated) {
    switch (sub) {
        case SubResource::Main:
            updated.status = current.status;
            break;
        case SubResource::Status:
            updated.spec = current.spec;
            break;
    }
}

Result<void> ObjectTraits<Node>::validate_update(const Node& /*current*/, const Node& /*updated*/) {
    return {};
}

// ── Pod ──────────────────────────────────────

const FieldSchema& ObjectTraits<Pod>::schema() {
    static const FieldSchema kSchema = FieldSchema::object()
        .with("metadata", FieldSchema::object())
        .with("spec", FieldSchema::object()
            .with("containers", FieldSchema::list_by_key("name"))
            .with("initContainers", FieldSchema::list_by_key("name")))
        .with("status", FieldSchema::object());
    return kSchema;
}

void ObjectTraits<Pod>::restrict_to(SubResource sub, const Pod& current, Pod& updated) {
    switch (sub) {
        case SubResource::Main:
            updated.status = current.status;
            break;
        case SubResource::Status:
            updated.spec = current.spec;
            break;
    }
}

Result<void> ObjectTraits<Pod>::validate_update(const Pod& current, const Pod& updated) {
    if (!current.spec.node_name.empty()
        && updated.spec.node_name != current.spec.node_name) {
        return Error{ErrorCode::Invalid,
                     "pod \"" + current.metadata.name
                     + "\" is invalid: spec.nodeName: field is immutable"};
    }
    if (current.spec.containers != updated.spec.containers
        || current.spec.init_containers != updated.spec.init_containers) {
        return Error{ErrorCode::Invalid,
                     "pod \"" + current.metadata.name
                     + "\" is invalid: spec: Forbidden: pod updates may not change containers"};
    }
    return {};
}

}  // namespace kube_device::kube
