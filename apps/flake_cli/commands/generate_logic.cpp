#include "generate_logic.h"

int execute_generate(flake::id::Generator& generator, const int count, const Encoding encoding,
                     std::ostream& out) {
  for (int i = 0; i < count; ++i) {
    out << encode(generator.generate(), encoding) << "\n";
  }
  return 0;
}
