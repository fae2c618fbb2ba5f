#pragma once

// cmd_decode: print the encodings and fields of one identifier given on the command line
int cmd_decode(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
