#include "decode.h"

#include "decode_logic.h"
#include "encoding.h"
#include "generator_flags.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct DecodeCliConfig {
  GeneratorFlags generator;               // NOLINT(readability-identifier-naming)
  Encoding encoding{Encoding::kDecimal};  // NOLINT(readability-identifier-naming)
};

std::vector<flake::apps::Option<DecodeCliConfig>> build_options() {
  std::vector<flake::apps::Option<DecodeCliConfig>> options = {
      {"--from", true, "Input encoding (decimal|base64|text)",
       [](DecodeCliConfig& c, const std::string& v) {
         const auto parsed = parse_encoding(v);
         if (!parsed.has_value()) {
           std::cerr << "Invalid --from: " << v << " (valid: decimal, base64, text)\n";
           return false;
         }
         c.encoding = parsed.value();
         return true;
       }},
  };
  append_generator_flags(options);
  return options;
}

}  // namespace

int cmd_decode(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = build_options();
  const auto parsed = flake::apps::parse_options(argc, argv, options, 2);
  if (!parsed.valid || parsed.positionals.size() != 1) {
    std::cerr << "Usage: flake_cli decode <value> [options]\n";
    flake::apps::print_usage(std::cerr, options);
    return 1;
  }

  const auto config = resolve_generator_config(parsed.config.generator);
  if (!config.has_value()) {
    std::cerr << "Error: " << config.error() << "\n";
    return 1;
  }

  return execute_decode(parsed.positionals.front(), parsed.config.encoding, config.value(),
                        std::cout, std::cerr);
}
