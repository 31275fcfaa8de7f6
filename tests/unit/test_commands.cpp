#include <gtest/gtest.h>
#include "app/commands.hpp"
#include "common/errors.hpp"
#include "generator/graph_generator.hpp"
#include "normalize/graph_normalizer.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace kgsynth;
namespace fs = std::filesystem;

class CommandsTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("kgsynth_test_commands_" +
               std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
        fs::create_directories(dir);

        write(dir / "schema.txt",
              "(Person,bornIn,City)\n"
              "\n"
              "(City,companyLocation,Company)\n"
              "(Person,owns,Spaceship)\n");
        write(dir / "instances.json",
              R"json({"Person": ["alice", "bob"], "City": ["nyc", "boston"], "Company": ["acme"]})json");
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    static void write(const fs::path& path, const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    static std::string read(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    GeneratorConfig generator_config(double probability) const {
        GeneratorConfig config;
        config.schema_path = (dir / "schema.txt").string();
        config.instances_path = (dir / "instances.json").string();
        config.output_path = (dir / "out" / "generated_kg.json").string();
        config.connection_probability = probability;
        return config;
    }

    // Runs the CLI with argv[0] = "kgsynth"
    static int run_cli(std::vector<std::string> arguments) {
        arguments.insert(arguments.begin(), "kgsynth");
        std::vector<char*> argv;
        for (auto& a : arguments) argv.push_back(a.data());

        CLI cli("kgsynth", "test");
        cli.register_command({"generate", "generate", {
            {"config", "c", "", false},
            {"schema", "s", "", false},
            {"instances", "i", "", false},
            {"output", "o", "", false},
            {"probability", "p", "", false},
            {"seed", "r", "", false},
            {"verbose", "V", "", true}
        }, cmd_generate});
        cli.register_command({"normalize", "normalize", {
            {"config", "c", "", false},
            {"output-dir", "o", "", false},
            {"verbose", "V", "", true}
        }, cmd_normalize, "<input_file>"});

        return cli.run(static_cast<int>(argv.size()), argv.data());
    }
};

// ==========================================
// Generate
// ==========================================

TEST_F(CommandsTest, GenerateWritesGraph) {
    testing::internal::CaptureStderr();
    testing::internal::CaptureStdout();
    int code = run_generate(generator_config(1.0));
    std::string out = testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, 0);
    EXPECT_NE(out.find("Successfully generated KG at"), std::string::npos);
    EXPECT_NE(err.find("Object Type 'Spaceship'"), std::string::npos);

    auto graph = nlohmann::ordered_json::parse(read(dir / "out" / "generated_kg.json"));
    EXPECT_EQ(graph.size(), 2);
    EXPECT_EQ(graph["(Person,bornIn,City)"].size(), 4);
    // Default table: each company has one location
    EXPECT_EQ(graph["(City,companyLocation,Company)"].size(), 1);
}

TEST_F(CommandsTest, GenerateIsReproducibleWithSeed) {
    auto config = generator_config(0.5);
    config.seed = 99;

    testing::internal::CaptureStdout();
    run_generate(config);
    std::string first = read(config.output_path);
    run_generate(config);
    std::string second = read(config.output_path);
    testing::internal::GetCapturedStdout();

    EXPECT_EQ(first, second);
}

TEST_F(CommandsTest, GenerateMissingSchemaThrowsFileNotFound) {
    auto config = generator_config(0.5);
    config.schema_path = (dir / "missing.txt").string();
    EXPECT_THROW(run_generate(config), FileNotFoundError);
}

TEST_F(CommandsTest, GenerateEmptySchemaStops) {
    write(dir / "schema.txt", "\n\nnot a relation\n");

    testing::internal::CaptureStderr();
    int code = run_generate(generator_config(0.5));
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, to_int(ExitCode::EmptySchema));
    EXPECT_NE(err.find("No relations found in schema."), std::string::npos);
    EXPECT_FALSE(fs::exists(dir / "out" / "generated_kg.json"));
}

TEST_F(CommandsTest, GenerateMalformedCatalogThrowsJsonDecode) {
    write(dir / "instances.json", "{\"Person\": [");
    EXPECT_THROW(run_generate(generator_config(0.5)), JsonDecodeError);
}

TEST_F(CommandsTest, GenerateUnencodableInstanceIsDataError) {
    write(dir / "instances.json", R"json({"Person": ["Smith, John"], "City": ["nyc"]})json");

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    int code = run_cli({"generate", "-s", (dir / "schema.txt").string(),
                        "-i", (dir / "instances.json").string(),
                        "-o", (dir / "out" / "generated_kg.json").string(), "-p", "1"});
    std::string err = testing::internal::GetCapturedStderr();
    testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, to_int(ExitCode::JsonDecode));
    EXPECT_NE(err.find("Smith, John"), std::string::npos);
    EXPECT_FALSE(fs::exists(dir / "out" / "generated_kg.json"));
}

TEST_F(CommandsTest, GenerateSkipsSchemaLineWithStrayParenthesis) {
    write(dir / "schema.txt", "(Person,bornIn,City))\n(Person,livesIn,City)\n");

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    int code = run_generate(generator_config(1.0));
    testing::internal::GetCapturedStderr();
    testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, 0);
    auto graph = nlohmann::ordered_json::parse(read(dir / "out" / "generated_kg.json"));
    EXPECT_EQ(graph.size(), 1);
    EXPECT_TRUE(graph.contains("(Person,livesIn,City)"));
}

TEST_F(CommandsTest, GenerateRejectsInvalidProbability) {
    EXPECT_THROW(run_generate(generator_config(2.0)), ConfigError);
}

// ==========================================
// Normalize
// ==========================================

TEST_F(CommandsTest, NormalizeWritesTables) {
    write(dir / "kg.json", R"json({"(City,companyLocation,Company)": ["(nyc,companyLocation,acme)"]})json");

    NormalizerConfig config;
    config.input_path = (dir / "kg.json").string();
    config.output_directory = (dir / "tables").string();

    testing::internal::CaptureStdout();
    int code = run_normalize(config);
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, 0);
    EXPECT_NE(out.find("Processing complete."), std::string::npos);

    auto node_types = nlohmann::ordered_json::parse(read(dir / "tables" / kNodeTypeMapFile));
    EXPECT_EQ(node_types["City"], ContentId::from_label("City").to_decimal_string());
    EXPECT_EQ(read(dir / "tables" / kEdgeTypeMapFile),
              "{\n    \"companyLocation\": \"66913872292210137410420219743062811165\"\n}");
}

TEST_F(CommandsTest, NormalizeMissingInputThrowsFileNotFound) {
    NormalizerConfig config;
    config.input_path = (dir / "missing.json").string();
    EXPECT_THROW(run_normalize(config), FileNotFoundError);
}

TEST_F(CommandsTest, GenerateThenNormalizeRoundTrip) {
    auto config = generator_config(1.0);
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    run_generate(config);

    NormalizerConfig normalize;
    normalize.input_path = config.output_path;
    normalize.output_directory = (dir / "tables").string();
    run_normalize(normalize);
    testing::internal::GetCapturedStderr();
    testing::internal::GetCapturedStdout();

    auto labels = nlohmann::ordered_json::parse(read(dir / "tables" / kTypeInstanceLabelsFile));
    EXPECT_EQ(labels["Person"], (nlohmann::ordered_json{"alice", "bob"}));
    EXPECT_EQ(labels["Company"], (nlohmann::ordered_json{"acme"}));
    EXPECT_FALSE(labels.contains("Spaceship"));
}

// ==========================================
// CLI wiring and exit codes
// ==========================================

TEST_F(CommandsTest, ConfigFromArgsPrecedence) {
    write(dir / "config.json", R"json({"connection_probability": 0.1, "seed": 5, "output_path": "from_file.json"})json");

    Args args;
    args.named["config"] = ArgValue{(dir / "config.json").string(), true};
    args.named["probability"] = ArgValue{"0.9", true};
    args.named["seed"] = ArgValue{"none", true};

    auto config = generator_config_from_args(args);
    EXPECT_DOUBLE_EQ(config.connection_probability, 0.9);
    EXPECT_FALSE(config.seed.has_value());
    EXPECT_EQ(config.output_path, "from_file.json");
}

TEST_F(CommandsTest, ConfigFromArgsRejectsBadValues) {
    Args args;
    args.named["probability"] = ArgValue{"0.5x", true};
    EXPECT_THROW(generator_config_from_args(args), std::runtime_error);

    Args seed_args;
    seed_args.named["seed"] = ArgValue{"-3", true};
    EXPECT_THROW(generator_config_from_args(seed_args), std::runtime_error);
}

TEST_F(CommandsTest, NormalizerConfigFromArgs) {
    Args args;
    args.positional = {"kg.json"};
    args.named["output-dir"] = ArgValue{"tables", true};
    args.named["verbose"] = ArgValue{"true", true};

    auto config = normalizer_config_from_args(args);
    EXPECT_EQ(config.input_path, "kg.json");
    EXPECT_EQ(config.output_directory, "tables");
    EXPECT_TRUE(config.verbose);

    args.positional.push_back("extra.json");
    EXPECT_THROW(normalizer_config_from_args(args), std::runtime_error);
}

TEST_F(CommandsTest, CliExitCodes) {
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();

    int missing = run_cli({"normalize", (dir / "missing.json").string()});
    write(dir / "bad.json", "{oops");
    int malformed = run_cli({"normalize", (dir / "bad.json").string(), "--output-dir", (dir / "t").string()});
    int unknown_flag = run_cli({"generate", "--bogus"});
    int bad_probability = run_cli({"generate", "--schema", (dir / "schema.txt").string(),
                                   "--instances", (dir / "instances.json").string(),
                                   "--probability", "1.5"});
    int ok = run_cli({"generate", "-s", (dir / "schema.txt").string(),
                      "-i", (dir / "instances.json").string(),
                      "-o", (dir / "cli.json").string(), "--seed=7", "-p", "0.5"});

    testing::internal::GetCapturedStderr();
    testing::internal::GetCapturedStdout();

    EXPECT_EQ(missing, to_int(ExitCode::FileNotFound));
    EXPECT_EQ(malformed, to_int(ExitCode::JsonDecode));
    EXPECT_EQ(unknown_flag, to_int(ExitCode::Usage));
    EXPECT_EQ(bad_probability, to_int(ExitCode::InvalidConfig));
    EXPECT_EQ(ok, 0);
    EXPECT_TRUE(fs::exists(dir / "cli.json"));
}

TEST_F(CommandsTest, CommandHelpListsOptions) {
    testing::internal::CaptureStdout();
    int code = run_cli({"normalize", "--help"});
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, 0);
    EXPECT_NE(out.find("Usage: kgsynth normalize <input_file> [options]"), std::string::npos);
    EXPECT_NE(out.find("--output-dir, -o <value>"), std::string::npos);
    EXPECT_NE(out.find("--verbose, -V\n"), std::string::npos);
}

// ==========================================
// Sample data shipped with the repository
// ==========================================

TEST_F(CommandsTest, SampleDataHonorsUniqueObjectRelations) {
    const char* data_dir = std::getenv("KGSYNTH_DATA_DIR");
    if (!data_dir) {
        GTEST_SKIP() << "KGSYNTH_DATA_DIR not set";
    }

    auto schema = load_schema((fs::path(data_dir) / "input" / "schema.txt").string());
    auto catalog = InstanceCatalog::load_from_json((fs::path(data_dir) / "input" / "instances.json").string());
    ASSERT_EQ(schema.size(), 15);

    GraphGenerator generator(1.0, 42, CardinalityPolicyTable::default_table());
    auto graph = generator.generate(schema, catalog);
    EXPECT_EQ(generator.statistics().relations_skipped, 0);

    const auto* state_of = graph.find(Triple{"State", "stateOf", "City"});
    ASSERT_NE(state_of, nullptr);
    EXPECT_EQ(state_of->policy, CardinalityPolicy::UniqueObject);
    EXPECT_EQ(state_of->edges.size(), catalog.instances_of("City").size());
}
