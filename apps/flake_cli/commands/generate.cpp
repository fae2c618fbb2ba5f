#include "generate.h"

#include "flake/config/generator_config.h"
#include "flake/id/generator.h"

#include "encoding.h"
#include "generate_logic.h"
#include "generator_flags.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct GenerateCliConfig {
  GeneratorFlags generator;               // NOLINT(readability-identifier-naming)
  int count{1};                           // NOLINT(readability-identifier-naming)
  Encoding encoding{Encoding::kDecimal};  // NOLINT(readability-identifier-naming)
  bool verbose{false};                    // NOLINT(readability-identifier-naming)
};

std::vector<flake::apps::Option<GenerateCliConfig>> build_options() {
  std::vector<flake::apps::Option<GenerateCliConfig>> options = {
      {"--count", true, "Number of identifiers to generate (default 1)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto parsed = flake::apps::parse_number<int>(v);
         if (!parsed.has_value() || parsed.value() < 0) {
           std::cerr << "Invalid --count: " << v << "\n";
           return false;
         }
         c.count = parsed.value();
         return true;
       }},
      {"--format", true, "Output encoding (decimal|base64|text)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto parsed = parse_encoding(v);
         if (!parsed.has_value()) {
           std::cerr << "Invalid --format: " << v << " (valid: decimal, base64, text)\n";
           return false;
         }
         c.encoding = parsed.value();
         return true;
       }},
      {"--verbose", false, "Print the effective configuration to stderr",
       [](GenerateCliConfig& c, const std::string&) {
         c.verbose = true;
         return true;
       }},
  };
  append_generator_flags(options);
  return options;
}

}  // namespace

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = build_options();
  const auto parsed = flake::apps::parse_options(argc, argv, options, 2);
  if (!parsed.valid) {
    std::cerr << "Usage: flake_cli generate [options]\n";
    flake::apps::print_usage(std::cerr, options);
    return 1;
  }
  const auto& cli = parsed.config;

  const auto config = resolve_generator_config(cli.generator);
  if (!config.has_value()) {
    std::cerr << "Error: " << config.error() << "\n";
    return 1;
  }

  if (cli.verbose) {
    std::cerr << "Generator:   " << flake::config::generator_config_to_log_string(config.value())
              << "\n";
    std::cerr << "Count:       " << cli.count << "\n";
  }

  const auto generator = flake::id::Generator::create(config.value());
  if (!generator.has_value()) {
    std::cerr << "Error: " << flake::core::to_string(generator.error()) << " ("
              << flake::config::generator_config_to_log_string(config.value()) << ")\n";
    return 1;
  }

  try {
    return execute_generate(*generator.value(), cli.count, cli.encoding, std::cout);
  } catch (const flake::id::TimeOverflowError& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
