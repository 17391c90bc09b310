/**
 * @file test_sync_flow.cpp
 * @brief Integration tests exercising the full read/claim/write-back cycle.
 */

#include "codec/annotation_codec.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "store/memory_store.hpp"
#include "sync/device_state_sync.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>

using namespace kube_device;

namespace {

const std::string kGpu = "nvidia.com/gpu";

kube::Node gpu_node(const std::string& name, int gpus) {
    kube::Node node;
    node.metadata.name = name;
    node.status.capacity = {{"cpu", *Quantity::parse("8")},
                            {kGpu, Quantity::from_int(gpus)}};
    node.status.allocatable = {{"cpu", *Quantity::parse("7500m")},
                               {kGpu, Quantity::from_int(gpus)}};
    NodeInfo advertised;
    advertised.capacity = {{kGpu, gpus}};
    advertised.allocatable = {{kGpu, gpus}};
    EXPECT_TRUE(AnnotationCodec::write(node.metadata, advertised).has_value());
    return node;
}

kube::Pod gpu_pod(const std::string& name, int gpus) {
    kube::Pod pod;
    pod.metadata.name = name;
    pod.metadata.namespace_ = "default";
    kube::Container c;
    c.name = "trainer";
    c.image = "trainer:1";
    c.resources.requests = {{kGpu, Quantity::from_int(gpus)}};
    pod.spec.containers.push_back(c);
    return pod;
}

/// What a device scheduler does between read and write.
void allocate(NodeInfo& node, PodInfo& pod, const std::string& device) {
    for (auto& [name, container] : pod.running_containers) {
        auto it = container.kube_requests.find(kGpu);
        if (it == container.kube_requests.end()) continue;
        container.requests[kGpu] = it->second;
        container.dev_requests[kGpu] = it->second;
        container.allocate_from[kGpu] = device;
        node.used[kGpu] += it->second;
    }
    pod.node_name = node.name;
}

}  // namespace

// ═══════════════════════════════════════════════
// Device state sync
// ═══════════════════════════════════════════════

class SyncFlowIntegration : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>(), LogLevel::Debug, 5};
    InMemoryNodeStore nodes_;
    InMemoryPodStore pods_;
    DeviceStateSync sync_{nodes_, pods_, logger_};

    void SetUp() override {
        ASSERT_TRUE(nodes_.create(gpu_node("gpu-node-1", 4)).has_value());
        ASSERT_TRUE(pods_.create(gpu_pod("train-0", 2)).has_value());
    }
};

TEST_F(SyncFlowIntegration, ClaimAllocateWriteBack) {
    auto node = sync_.read_node("gpu-node-1");
    ASSERT_TRUE(node.has_value()) << node.error().full_message();
    EXPECT_EQ(node->info.name, "gpu-node-1");
    EXPECT_EQ(node->info.capacity.at(kGpu), 4);
    EXPECT_EQ(node->info.kube_alloc.at("cpu"), 8);

    auto pod = sync_.read_pod("default", "train-0", true);
    ASSERT_TRUE(pod.has_value()) << pod.error().full_message();
    EXPECT_EQ(pod->info.running_containers.at("trainer").kube_requests.at(kGpu), 2);

    allocate(node->info, pod->info, "gpu0");

    auto written_node = sync_.write_node(node->object, node->info);
    ASSERT_TRUE(written_node.has_value()) << written_node.error().full_message();
    auto written_pod = sync_.write_pod(pod->object, pod->info);
    ASSERT_TRUE(written_pod.has_value()) << written_pod.error().full_message();

    // A later reader sees the allocation without any cache.
    auto node_again = sync_.read_node("gpu-node-1");
    ASSERT_TRUE(node_again.has_value());
    EXPECT_EQ(node_again->info.used.at(kGpu), 2);

    auto pod_again = sync_.read_pod("default", "train-0", false);
    ASSERT_TRUE(pod_again.has_value());
    EXPECT_EQ(pod_again->info.node_name, "gpu-node-1");
    EXPECT_EQ(pod_again->info.running_containers.at("trainer").allocate_from.at(kGpu), "gpu0");
}

TEST_F(SyncFlowIntegration, NodeWriteTouchesBothSubResourcesWithSameBytes) {
    auto node = sync_.read_node("gpu-node-1");
    ASSERT_TRUE(node.has_value());
    node->info.used[kGpu] = 1;
    nodes_.clear_calls();

    ASSERT_TRUE(sync_.write_node(node->object, node->info).has_value());

    auto calls = nodes_.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].sub_resource, SubResource::Main);
    EXPECT_EQ(calls[1].sub_resource, SubResource::Status);
    EXPECT_EQ(calls[0].patch_bytes, calls[1].patch_bytes);

    auto patch = nlohmann::json::parse(calls[0].patch_bytes);
    ASSERT_EQ(patch.size(), 1u);
    ASSERT_EQ(patch["metadata"].size(), 1u);
    EXPECT_TRUE(patch["metadata"]["annotations"].contains(std::string{kDeviceInfoAnnotation}));
}

TEST_F(SyncFlowIntegration, ConcurrentWriterFieldsArePreserved) {
    auto node = sync_.read_node("gpu-node-1");
    ASSERT_TRUE(node.has_value());

    // Another controller updates the node after our read.
    ASSERT_TRUE(nodes_.mutate("gpu-node-1", {}, [](kube::Node& n) {
        n.metadata.labels["zone"] = "eu-1";
        n.metadata.annotations["other/owner"] = "ops";
        n.status.capacity["memory"] = *Quantity::parse("64Gi");
    }).has_value());

    node->info.used[kGpu] = 3;
    auto written = sync_.write_node(node->object, node->info);
    ASSERT_TRUE(written.has_value()) << written.error().full_message();

    EXPECT_EQ(written->metadata.labels.at("zone"), "eu-1");
    EXPECT_EQ(written->metadata.annotations.at("other/owner"), "ops");
    EXPECT_EQ(written->status.capacity.at("memory").string(), "64Gi");

    auto decoded = AnnotationCodec::read_node_info(written->metadata);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->used.at(kGpu), 3);
}

TEST_F(SyncFlowIntegration, CachedUsageOverridesStoredUsage) {
    auto node = sync_.read_node("gpu-node-1");
    ASSERT_TRUE(node.has_value());
    node->info.used[kGpu] = 1;
    ASSERT_TRUE(sync_.write_node(node->object, node->info).has_value());

    NodeInfo cached;
    cached.used = {{kGpu, 3}};
    auto with_cache = sync_.read_node("gpu-node-1", &cached);
    ASSERT_TRUE(with_cache.has_value());
    EXPECT_EQ(with_cache->info.used.at(kGpu), 3);
}

TEST_F(SyncFlowIntegration, RestrictedWriteSurvivesStaleBinding) {
    auto pod = sync_.read_pod("default", "train-0", true);
    ASSERT_TRUE(pod.has_value());
    EXPECT_TRUE(pod->object.spec.node_name.empty());

    // The orchestrator binds the pod after our read.
    ASSERT_TRUE(pods_.mutate("train-0", "default", [](kube::Pod& p) {
        p.spec.node_name = "gpu-node-1";
    }).has_value());

    NodeInfo node_info;
    node_info.name = "gpu-node-1";
    allocate(node_info, pod->info, "gpu1");

    // A whole-object update from the stale copy is refused...
    kube::Pod stale = pod->object;
    ASSERT_TRUE(AnnotationCodec::write(stale.metadata, pod->info).has_value());
    stale.metadata.resource_version.clear();
    auto refused = pods_.update(stale);
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, ErrorCode::Invalid);

    // ...but the restricted write only replaces annotations on the live copy.
    auto written = sync_.write_pod_restricted(pod->object, pod->info);
    ASSERT_TRUE(written.has_value()) << written.error().full_message();
    EXPECT_EQ(written->spec.node_name, "gpu-node-1");

    auto decoded = AnnotationCodec::read_pod_info(written->metadata);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->node_name, "gpu-node-1");
    EXPECT_EQ(decoded->running_containers.at("trainer").allocate_from.at(kGpu), "gpu1");
}

TEST_F(SyncFlowIntegration, ReclaimDiscardsTentativeAllocation) {
    auto pod = sync_.read_pod("default", "train-0", true);
    ASSERT_TRUE(pod.has_value());
    NodeInfo node_info;
    node_info.name = "gpu-node-1";
    allocate(node_info, pod->info, "gpu2");
    ASSERT_TRUE(sync_.write_pod(pod->object, pod->info).has_value());

    auto reclaimed = sync_.read_pod("default", "train-0", true);
    ASSERT_TRUE(reclaimed.has_value());
    const auto& c = reclaimed->info.running_containers.at("trainer");
    EXPECT_TRUE(c.allocate_from.empty());
    EXPECT_EQ(c.dev_requests, c.requests);
    EXPECT_EQ(c.dev_requests.at(kGpu), 2);
    EXPECT_TRUE(reclaimed->info.node_name.empty());
}

TEST_F(SyncFlowIntegration, MissingObjectsAreNotFound) {
    auto node = sync_.read_node("nope");
    ASSERT_FALSE(node.has_value());
    EXPECT_EQ(node.error().code, ErrorCode::NotFound);

    auto pod = sync_.read_pod("default", "nope", false);
    ASSERT_FALSE(pod.has_value());
    EXPECT_EQ(pod.error().code, ErrorCode::NotFound);
}

TEST_F(SyncFlowIntegration, CorruptAnnotationIsReported) {
    ASSERT_TRUE(nodes_.mutate("gpu-node-1", {}, [](kube::Node& n) {
        n.metadata.annotations[std::string{kDeviceInfoAnnotation}] = "{corrupt";
    }).has_value());

    auto node = sync_.read_node("gpu-node-1");
    ASSERT_FALSE(node.has_value());
    EXPECT_EQ(node.error().root().code, ErrorCode::DeserializationError);
}

TEST_F(SyncFlowIntegration, StatusFailureLeavesMainWritten) {
    auto node = sync_.read_node("gpu-node-1");
    ASSERT_TRUE(node.has_value());
    node->info.used[kGpu] = 2;

    nodes_.inject_failure(StoreOp::Patch, Error{ErrorCode::Conflict, "busy"}, SubResource::Status);
    auto written = sync_.write_node(node->object, node->info);
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().sub_resource, "status");

    auto again = sync_.read_node("gpu-node-1");
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->info.used.at(kGpu), 2);
}
