/**
 * @file main.cpp
 * @brief kube_device_sync command-line entry point.
 *
 * Offline access to the sync core: reconcile Node/Pod JSON documents, diff
 * two objects into a strategic merge patch, or run a full claim/allocate/
 * write-back cycle against the in-memory store.
 *
 * Results go to stdout as JSON; logs go to stderr or to the configured
 * log directory.
 */

#include "codec/annotation_codec.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "kube/object_traits.hpp"
#include "kube/objects.hpp"
#include "patch/patch_builder.hpp"
#include "reconciler/reconciler.hpp"
#include "store/memory_store.hpp"
#include "sync/device_state_sync.hpp"
#include "telemetry/json_sink.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace kube_device;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::optional<int> verbosity;
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::filesystem::path> existing_path;
    std::optional<bool> invalidate;
    std::string kind = "pod";
    bool help = false;
};

void print_usage(std::ostream& os) {
    os << "Usage: kube_device_sync [OPTIONS] <command> [ARGS]\n"
       << "Commands:\n"
       << "  node <node.json> [--existing <nodeinfo.json>]   Reconcile a node\n"
       << "  pod <pod.json> [--invalidate|--keep]            Reconcile a pod\n"
       << "  patch [--kind node|pod] <old.json> <new.json>   Print the merge patch\n"
       << "  demo                                            Claim/allocate/write-back cycle\n"
       << "Options:\n"
       << "  --config <path>    TOML configuration file\n"
       << "  --verbosity <n>    Log verbosity (overrides config)\n"
       << "  --help, -h         Show this help message\n";
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--verbosity" && i + 1 < argc) {
            auto verbosity = parse_verbosity(argv[++i]);
            if (!verbosity) {
                std::cerr << verbosity.error().message << '\n';
                return std::nullopt;
            }
            args.verbosity = *verbosity;
        } else if (arg == "--existing" && i + 1 < argc) {
            args.existing_path = argv[++i];
        } else if (arg == "--kind" && i + 1 < argc) {
            args.kind = argv[++i];
        } else if (arg == "--invalidate") {
            args.invalidate = true;
        } else if (arg == "--keep") {
            args.invalidate = false;
        } else if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (!arg.empty() && arg.front() == '-') {
            std::cerr << "Unknown option: " << arg << '\n';
            return std::nullopt;
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

Result<nlohmann::json> read_json_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::IoError, "cannot open " + path.string()};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto j = nlohmann::json::parse(buffer.str(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return Error{ErrorCode::DeserializationError, path.string() + " is not valid JSON"};
    }
    return j;
}

template <typename ObjectT>
Result<ObjectT> read_object_file(const std::filesystem::path& path) {
    auto j = read_json_file(path);
    if (!j) return j.error();
    auto object = kube::object_from_json<ObjectT>(*j);
    if (!object) return object.error().wrap(object.error().code, path.string());
    return object;
}

int report(const Error& error) {
    std::cerr << "error (" << to_string(error.code) << "): " << error.full_message() << '\n';
    return kExitFailure;
}

void print_json(const nlohmann::json& j) {
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

// ── Commands ─────────────────────────────────

int run_node(const CLIArgs& args, Logger& logger) {
    if (args.positional.size() != 1) {
        print_usage(std::cerr);
        return kExitUsage;
    }
    auto node = read_object_file<kube::Node>(args.positional[0]);
    if (!node) return report(node.error());

    std::optional<NodeInfo> existing;
    if (args.existing_path) {
        auto j = read_json_file(*args.existing_path);
        if (!j) return report(j.error());
        auto decoded = AnnotationCodec::decode_node_info(j->dump());
        if (!decoded) return report(decoded.error());
        existing = std::move(*decoded);
    }

    Reconciler reconciler(logger);
    auto info = reconciler.reconcile_node(*node, existing ? &*existing : nullptr);
    if (!info) return report(info.error());
    print_json(*info);
    return kExitOk;
}

int run_pod(const CLIArgs& args, const Config& config, Logger& logger) {
    if (args.positional.size() != 1) {
        print_usage(std::cerr);
        return kExitUsage;
    }
    auto pod = read_object_file<kube::Pod>(args.positional[0]);
    if (!pod) return report(pod.error());

    Reconciler reconciler(logger);
    auto info = reconciler.reconcile_pod(*pod,
                                         args.invalidate.value_or(config.sync.invalidate_on_claim));
    if (!info) return report(info.error());
    print_json(*info);
    return kExitOk;
}

template <typename ObjectT>
int print_patch(const std::filesystem::path& old_path, const std::filesystem::path& new_path) {
    auto old_object = read_object_file<ObjectT>(old_path);
    if (!old_object) return report(old_object.error());
    auto new_object = read_object_file<ObjectT>(new_path);
    if (!new_object) return report(new_object.error());

    auto patch = build_patch(old_object->metadata.name, *old_object, *new_object,
                             kube::ObjectTraits<ObjectT>::schema());
    if (!patch) return report(patch.error());
    print_json(*patch);
    return kExitOk;
}

int run_patch(const CLIArgs& args) {
    if (args.positional.size() != 2) {
        print_usage(std::cerr);
        return kExitUsage;
    }
    if (args.kind == "node") return print_patch<kube::Node>(args.positional[0], args.positional[1]);
    if (args.kind == "pod")  return print_patch<kube::Pod>(args.positional[0], args.positional[1]);
    std::cerr << "Unknown kind: " << args.kind << '\n';
    return kExitUsage;
}

/**
 * @brief Seed an in-memory cluster, claim a pod, allocate devices and write
 *        the state back the way a device scheduler would.
 */
int run_demo(const Config& config, Logger& logger) {
    const std::string gpu = "nvidia.com/gpu";
    const std::string ns = config.sync.pod_namespace;

    InMemoryNodeStore nodes;
    InMemoryPodStore pods;

    kube::Node node;
    node.metadata.name = "gpu-node-1";
    node.status.capacity = {{"cpu", *Quantity::parse("8")}, {gpu, *Quantity::parse("4")}};
    node.status.allocatable = {{"cpu", *Quantity::parse("7500m")}, {gpu, *Quantity::parse("4")}};
    NodeInfo advertised;
    advertised.capacity = {{gpu, 4}};
    advertised.allocatable = {{gpu, 4}};
    if (auto written = AnnotationCodec::write(node.metadata, advertised); !written) {
        return report(written.error());
    }
    if (auto created = nodes.create(node); !created) return report(created.error());

    kube::Pod pod;
    pod.metadata.name = "train-0";
    pod.metadata.namespace_ = ns;
    kube::Container trainer;
    trainer.name = "trainer";
    trainer.image = "trainer:latest";
    trainer.resources.requests = {{gpu, *Quantity::parse("2")}, {"cpu", *Quantity::parse("500m")}};
    pod.spec.containers.push_back(trainer);
    if (auto created = pods.create(pod); !created) return report(created.error());

    DeviceStateSync sync(nodes, pods, logger);

    auto observed_node = sync.read_node(node.metadata.name);
    if (!observed_node) return report(observed_node.error());
    auto observed_pod = sync.read_pod(ns, pod.metadata.name, config.sync.invalidate_on_claim);
    if (!observed_pod) return report(observed_pod.error());

    // Allocate every declared GPU from the node's first devices.
    PodInfo& pod_info = observed_pod->info;
    NodeInfo& node_info = observed_node->info;
    for (auto& [name, container] : pod_info.running_containers) {
        auto it = container.kube_requests.find(gpu);
        if (it == container.kube_requests.end()) continue;
        container.requests[gpu] = it->second;
        container.dev_requests[gpu] = it->second;
        container.allocate_from[gpu] = node_info.name + "/" + gpu + "/0";
        node_info.used[gpu] += it->second;
    }
    pod_info.node_name = node_info.name;
    logger.info("Allocated " + std::to_string(node_info.used[gpu]) + " " + gpu
                + " on " + node_info.name + " for pod " + pod_info.name);

    auto written_node = sync.write_node(observed_node->object, node_info);
    if (!written_node) return report(written_node.error());

    // The orchestrator binds the pod meanwhile; the cached copy is now stale.
    auto bound = pods.mutate(pod.metadata.name, ns,
                             [&](kube::Pod& p) { p.spec.node_name = node_info.name; });
    if (!bound) return report(bound.error());

    auto written_pod = sync.write_pod_restricted(observed_pod->object, pod_info);
    if (!written_pod) return report(written_pod.error());

    print_json(nlohmann::json{{"node", *written_node}, {"pod", *written_pod}});
    return kExitOk;
}

std::unique_ptr<ILogSink> make_sink(const Config& config) {
    if (!config.logging.log_dir.empty()) {
        return std::make_unique<JsonFileSink>(config.logging.log_dir, config.logging.file_prefix);
    }
    return std::make_unique<StderrSink>();
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage(std::cerr);
        return kExitUsage;
    }
    if (args->help || args->command.empty()) {
        print_usage(args->help ? std::cout : std::cerr);
        return args->help ? kExitOk : kExitUsage;
    }

    Config config = default_config();
    if (args->config_path) {
        auto loaded = load_config(*args->config_path);
        if (!loaded) return report(loaded.error());
        config = std::move(*loaded);
    }
    if (args->verbosity) config.logging.verbosity = *args->verbosity;

    Logger logger(make_sink(config),
                  parse_log_level(config.logging.level).value_or(LogLevel::Info),
                  config.logging.verbosity);

    int rc = kExitUsage;
    if (args->command == "node") {
        rc = run_node(*args, logger);
    } else if (args->command == "pod") {
        rc = run_pod(*args, config, logger);
    } else if (args->command == "patch") {
        rc = run_patch(*args);
    } else if (args->command == "demo") {
        rc = run_demo(config, logger);
    } else {
        std::cerr << "Unknown command: " << args->command << '\n';
        print_usage(std::cerr);
    }

    logger.flush();
    return rc;
}
