/**
 * @file test_update_orchestrator.cpp
 * @brief Tests for patch plans and restricted updates.
 */

#include "codec/annotation_codec.hpp"
#include "store/memory_store.hpp"
#include "telemetry/json_sink.hpp"
#include "update/update_orchestrator.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>

using namespace kube_device;

namespace {

kube::Node make_node(const std::string& name) {
    kube::Node node;
    node.metadata.name = name;
    node.status.capacity["nvidia.com/gpu"] = *Quantity::parse("4");
    return node;
}

kube::Pod make_pod(const std::string& name, const std::string& node_name) {
    kube::Pod pod;
    pod.metadata.name = name;
    pod.metadata.namespace_ = "default";
    pod.spec.node_name = node_name;
    kube::Container c;
    c.name = "main";
    c.image = "app:1";
    pod.spec.containers.push_back(c);
    return pod;
}

/// Forwards to a real store but reports a different identity on get().
class RenamingPodStore : public PodStore {
public:
    explicit RenamingPodStore(PodStore& inner) : inner_(inner) {}

    Result<kube::Pod> get(const std::string& name, const std::string& namespace_) override {
        auto pod = inner_.get(name, namespace_);
        if (pod) pod->metadata.name = "impostor";
        return pod;
    }
    Result<kube::Pod> patch(const std::string& name, const std::string& namespace_,
                            std::string_view patch_bytes, SubResource sub) override {
        return inner_.patch(name, namespace_, patch_bytes, sub);
    }
    Result<kube::Pod> update(const kube::Pod& object) override {
        ++updates;
        return inner_.update(object);
    }

    int updates = 0;

private:
    PodStore& inner_;
};

}  // namespace

class UpdateOrchestratorTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>(), LogLevel::Debug, 5};
    InMemoryNodeStore nodes_;
    InMemoryPodStore pods_;
    UpdateOrchestrator<kube::Node> node_updates_{nodes_, logger_};
    UpdateOrchestrator<kube::Pod> pod_updates_{pods_, logger_};

    kube::Node seeded_node() {
        auto created = nodes_.create(make_node("n1"));
        EXPECT_TRUE(created.has_value());
        nodes_.clear_calls();
        return created ? *created : kube::Node{};
    }
};

// ═══════════════════════════════════════════════
// Patch plans
// ═══════════════════════════════════════════════

TEST_F(UpdateOrchestratorTest, MetadataAndStatusUseIdenticalBytes) {
    auto old_node = seeded_node();
    auto new_node = old_node;
    new_node.metadata.annotations[std::string{kDeviceInfoAnnotation}] = R"({"used":{"g":1}})";

    auto result = node_updates_.patch_metadata_and_status("n1", old_node, new_node);
    ASSERT_TRUE(result.has_value()) << result.error().full_message();
    EXPECT_EQ(result->metadata.annotations.at(std::string{kDeviceInfoAnnotation}),
              R"({"used":{"g":1}})");

    auto calls = nodes_.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].sub_resource, SubResource::Main);
    EXPECT_EQ(calls[1].sub_resource, SubResource::Status);
    EXPECT_EQ(calls[0].patch_bytes, calls[1].patch_bytes);

    auto patch = nlohmann::json::parse(calls[0].patch_bytes);
    EXPECT_EQ(patch.size(), 1u);
    EXPECT_TRUE(patch.contains("metadata"));
}

TEST_F(UpdateOrchestratorTest, StatusFailureNamesSubResourceAndKeepsMainWrite) {
    auto old_node = seeded_node();
    auto new_node = old_node;
    new_node.metadata.annotations["k"] = "v";

    nodes_.inject_failure(StoreOp::Patch, Error{ErrorCode::Conflict, "status rejected"},
                          SubResource::Status);
    auto result = node_updates_.patch_metadata_and_status("n1", old_node, new_node);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::PatchApplyError);
    EXPECT_EQ(result.error().sub_resource, "status");
    EXPECT_EQ(result.error().root().code, ErrorCode::Conflict);

    // The main patch is not rolled back.
    auto live = nodes_.get("n1", {});
    ASSERT_TRUE(live.has_value());
    EXPECT_EQ(live->metadata.annotations.at("k"), "v");
}

TEST_F(UpdateOrchestratorTest, MainFailureStopsPlan) {
    auto old_node = seeded_node();
    auto new_node = old_node;
    new_node.metadata.annotations["k"] = "v";

    nodes_.inject_failure(StoreOp::Patch, Error{ErrorCode::NotFound, "gone"}, SubResource::Main);
    auto result = node_updates_.patch_metadata_and_status("n1", old_node, new_node);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().sub_resource, "main");
    EXPECT_EQ(nodes_.calls().size(), 1u);
}

TEST_F(UpdateOrchestratorTest, NoChangeStillIssuesEmptyPatch) {
    auto node = seeded_node();
    auto result = node_updates_.patch_metadata_and_status("n1", node, node);
    ASSERT_TRUE(result.has_value());

    auto calls = nodes_.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].patch_bytes, "{}");
    EXPECT_EQ(result->metadata.resource_version, node.metadata.resource_version);
}

TEST_F(UpdateOrchestratorTest, EmptyPlanIsRejected) {
    (void)seeded_node();
    auto result = node_updates_.apply_patch_plan("n1", {}, "{}", PatchPlan{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::PatchApplyError);
    EXPECT_TRUE(nodes_.calls().empty());
}

TEST_F(UpdateOrchestratorTest, DiffFailureIssuesNoCalls) {
    auto old_node = seeded_node();
    auto new_node = old_node;
    new_node.metadata.annotations["bad"] = "\xff";

    auto result = node_updates_.patch_metadata_and_status("n1", old_node, new_node);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DiffError);
    EXPECT_TRUE(nodes_.calls().empty());
}

TEST_F(UpdateOrchestratorTest, PatchMetadataUsesOldNamespace) {
    auto created = pods_.create(make_pod("p", "gpu-node-1"));
    ASSERT_TRUE(created.has_value());
    pods_.clear_calls();

    auto new_pod = *created;
    new_pod.metadata.namespace_ = "elsewhere";
    new_pod.metadata.annotations["k"] = "v";

    auto result = pod_updates_.patch_metadata("p", *created, new_pod);
    ASSERT_TRUE(result.has_value()) << result.error().full_message();
    EXPECT_EQ(result->metadata.namespace_, "default");

    auto calls = pods_.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].namespace_, "default");
    EXPECT_EQ(calls[0].sub_resource, SubResource::Main);
}

// ═══════════════════════════════════════════════
// Restricted update
// ═══════════════════════════════════════════════

TEST_F(UpdateOrchestratorTest, RestrictedUpdateOnlyChangesAnnotations) {
    ASSERT_TRUE(pods_.create(make_pod("p", "gpu-node-1")).has_value());

    kube::Pod desired = make_pod("p", "");           // stale: never saw the binding
    desired.spec.containers[0].image = "app:999";    // stale in an immutable field too
    desired.metadata.labels["drift"] = "yes";
    desired.metadata.annotations["k"] = "v";

    auto result = pod_updates_.update_metadata_only(desired);
    ASSERT_TRUE(result.has_value()) << result.error().full_message();
    EXPECT_EQ(result->metadata.annotations.at("k"), "v");
    EXPECT_EQ(result->spec.node_name, "gpu-node-1");
    EXPECT_EQ(result->spec.containers[0].image, "app:1");
    EXPECT_TRUE(result->metadata.labels.empty());
}

TEST_F(UpdateOrchestratorTest, RestrictedUpdateIdentityMismatch) {
    ASSERT_TRUE(pods_.create(make_pod("p", "gpu-node-1")).has_value());
    RenamingPodStore renaming(pods_);
    UpdateOrchestrator<kube::Pod> updates(renaming, logger_);

    kube::Pod desired = make_pod("p", "gpu-node-1");
    desired.metadata.annotations["k"] = "v";
    auto result = updates.update_metadata_only(desired);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::IdentityMismatch);
    EXPECT_EQ(renaming.updates, 0);
}

TEST_F(UpdateOrchestratorTest, RestrictedUpdatePassesThroughNotFound) {
    auto result = pod_updates_.update_metadata_only(make_pod("ghost", ""));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(UpdateOrchestratorTest, RestrictedUpdatePassesThroughConflict) {
    ASSERT_TRUE(pods_.create(make_pod("p", "gpu-node-1")).has_value());
    pods_.inject_failure(StoreOp::Update, Error{ErrorCode::Conflict, "modified"});

    kube::Pod desired = make_pod("p", "gpu-node-1");
    desired.metadata.annotations["k"] = "v";
    auto result = pod_updates_.update_metadata_only(desired);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Conflict);
    EXPECT_EQ(result.error().message, "modified");
}

TEST_F(UpdateOrchestratorTest, RestrictedUpdateCanClearAnnotations) {
    kube::Pod pod = make_pod("p", "gpu-node-1");
    pod.metadata.annotations["old"] = "x";
    ASSERT_TRUE(pods_.create(pod).has_value());

    auto result = pod_updates_.update_metadata_only(make_pod("p", ""));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->metadata.annotations.empty());
}
