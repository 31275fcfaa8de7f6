#pragma once

#include "cli/cli.hpp"
#include "generator/generator_config.hpp"
#include "normalize/normalizer_config.hpp"

namespace kgsynth {

/**
 * @brief Build the generator config: defaults, then --config file, then flags
 * @throws ConfigError, FileNotFoundError, JsonDecodeError, std::runtime_error on bad flag values
 */
GeneratorConfig generator_config_from_args(const Args& args);

/**
 * @brief Build the normalizer config: defaults, then --config file, then flags and positional input
 */
NormalizerConfig normalizer_config_from_args(const Args& args);

/**
 * @brief Generate a graph from a schema and an instance catalog and write it out
 * @return Process exit code
 * @throws Error subclasses for fatal conditions
 */
int run_generate(const GeneratorConfig& config);

/**
 * @brief Normalize a generated graph into identifier tables and type indices
 * @return Process exit code
 * @throws Error subclasses for fatal conditions
 */
int run_normalize(const NormalizerConfig& config);

// CLI handlers
int cmd_generate(const Args& args);
int cmd_normalize(const Args& args);

} // namespace kgsynth
