#pragma once

// cmd_generate: build a generator from --config and flags, then print --count identifiers
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
