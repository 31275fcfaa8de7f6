#include "app/commands.hpp"
#include "common/errors.hpp"
#include "generator/graph_generator.hpp"
#include "graph/instance_catalog.hpp"
#include "graph/schema.hpp"
#include "normalize/graph_normalizer.hpp"
#include <filesystem>
#include <iostream>
#include <limits>

namespace fs = std::filesystem;

namespace kgsynth {

namespace {

std::optional<std::uint32_t> parse_seed(const std::string& text) {
    if (text == "none") return std::nullopt;

    size_t consumed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("--seed expects an unsigned integer or 'none', got '" + text + "'");
    }
    if (consumed != text.size() || text.front() == '-' ||
        value > std::numeric_limits<std::uint32_t>::max()) {
        throw std::runtime_error("--seed expects an unsigned 32-bit integer or 'none', got '" + text + "'");
    }
    return static_cast<std::uint32_t>(value);
}

void require_file(const std::string& path) {
    if (!fs::exists(path)) {
        throw FileNotFoundError(path);
    }
}

} // namespace

// ============== Config assembly ==============

GeneratorConfig generator_config_from_args(const Args& args) {
    GeneratorConfig config;
    if (args.has("config")) {
        config = GeneratorConfig::from_json_file(args.get("config").value);
    }

    if (args.has("schema")) config.schema_path = args.get("schema").value;
    if (args.has("instances")) config.instances_path = args.get("instances").value;
    if (args.has("output")) config.output_path = args.get("output").value;
    if (args.has("probability")) config.connection_probability = args.get("probability").as_double();
    if (args.has("seed")) config.seed = parse_seed(args.get("seed").value);
    if (args.get("verbose").as_flag()) config.verbose = true;

    return config;
}

NormalizerConfig normalizer_config_from_args(const Args& args) {
    NormalizerConfig config;
    if (args.has("config")) {
        config = NormalizerConfig::from_json_file(args.get("config").value);
    }

    if (args.positional.size() > 1) {
        throw std::runtime_error("Expected a single input file, got " +
                                 std::to_string(args.positional.size()));
    }
    if (!args.positional.empty()) config.input_path = args.positional.front();
    if (args.has("output-dir")) config.output_directory = args.get("output-dir").value;
    if (args.get("verbose").as_flag()) config.verbose = true;

    return config;
}

// ============== kgsynth generate ==============

int run_generate(const GeneratorConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw ConfigError(error);
    }

    require_file(config.schema_path);
    require_file(config.instances_path);

    RelationSchema schema = load_schema(config.schema_path, config.verbose);
    if (schema.empty()) {
        std::cerr << "No relations found in schema.\n";
        return to_int(ExitCode::EmptySchema);
    }

    InstanceCatalog catalog = InstanceCatalog::load_from_json(config.instances_path);

    if (config.verbose) {
        std::cout << "Loaded " << schema.size() << " relations and " << catalog.num_types()
                  << " node types (" << catalog.num_instances() << " instances)\n";
        std::cout << "Seed: " << (config.seed ? std::to_string(*config.seed) : "none") << "\n";
    }

    GraphGenerator generator(config.connection_probability, config.seed, config.cardinality);
    generator.set_verbose(config.verbose);
    GeneratedGraph graph = generator.generate(schema, catalog);

    graph.export_to_json(config.output_path);
    std::cout << "Successfully generated KG at " << config.output_path
              << " with probability " << config.connection_probability << "\n";

    if (config.verbose) {
        generator.statistics().print_summary();
    }
    return to_int(ExitCode::Success);
}

int cmd_generate(const Args& args) {
    return run_generate(generator_config_from_args(args));
}

// ============== kgsynth normalize ==============

int run_normalize(const NormalizerConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw ConfigError(error);
    }

    nlohmann::ordered_json graph = load_graph_json(config.input_path);

    GraphNormalizer normalizer(config.verbose);
    normalizer.process(graph);
    NormalizedGraph result = normalizer.finalize();

    result.write_outputs(config.output_directory);

    if (config.verbose) {
        normalizer.statistics().print_summary();
    }
    std::cout << "Processing complete.\n";
    return to_int(ExitCode::Success);
}

int cmd_normalize(const Args& args) {
    return run_normalize(normalizer_config_from_args(args));
}

} // namespace kgsynth
