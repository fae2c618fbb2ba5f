#pragma once

#include "flake/id/generator.h"

#include "encoding.h"
#include <ostream>

// execute_generate: issue `count` identifiers from generator and write one per line to out.
// TimeOverflowError propagates to the caller.
int execute_generate(flake::id::Generator& generator, int count, Encoding encoding,
                     std::ostream& out);
