#pragma once

#include "flake/config/generator_config.h"

#include "encoding.h"
#include <ostream>
#include <string_view>

// execute_decode: parse `input` in the given encoding and print a JSON document with all three
// encodings and the fields read back under config's layout and epoch.
// Parse and layout errors are written to err and return 1.
int execute_decode(std::string_view input, Encoding from,
                   const flake::config::GeneratorConfig& config, std::ostream& out,
                   std::ostream& err);
