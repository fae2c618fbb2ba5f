#include "flake/core/version.h"

#include "commands/decode.h"
#include "commands/generate.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "Usage: flake_cli <command> [options]\n"
            << "Commands:\n"
            << "  generate   Generate identifiers\n"
            << "  decode     Show the encodings and fields of an identifier\n"
            << "  version    Print the build version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "decode") {
    return cmd_decode(argc, argv);
  }
  if (subcommand == "version") {
    std::cout << "flake v" << flake::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
