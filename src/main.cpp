#include "app/commands.hpp"
#include "cli/cli.hpp"

using namespace kgsynth;

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("kgsynth", "1.0.0");

    // kgsynth generate
    cli.register_command({
        "generate",
        "Generate a knowledge graph from a relation schema and an instance catalog",
        {
            {"config", "c", "JSON config file (fields: schema_path, instances_path, output_path, connection_probability, seed, cardinality, verbose)", false},
            {"schema", "s", "Relation schema file, one (SubjectType,predicate,ObjectType) per line (default: input/schema.txt)", false},
            {"instances", "i", "Instance catalog JSON (default: input/instances.json)", false},
            {"output", "o", "Output path for the generated graph JSON (default: generated_kg.json)", false},
            {"probability", "p", "Connection probability in [0, 1] (default: 0.5)", false},
            {"seed", "r", "Random seed, or 'none' for non-reproducible draws (default: 42)", false},
            {"verbose", "V", "Report skipped schema lines and per-relation edge counts", true}
        },
        cmd_generate
    });

    // kgsynth normalize
    cli.register_command({
        "normalize",
        "Derive content-hash identifier tables and type -> instance indices from a generated graph",
        {
            {"config", "c", "JSON config file (fields: input_path, output_directory, verbose)", false},
            {"output-dir", "o", "Output directory for the five tables (default: output)", false},
            {"verbose", "V", "Report duplicate instances", true}
        },
        cmd_normalize,
        "<input_file>"
    });

    return cli.run(argc, argv);
}
