#pragma once

#include "../context.hh"

#include <oirun/argv_parser.hh>

namespace commands {

// Displays help
void help(const char* program_name);

void version();

// The functions below return the exit code of the program

int detect(CliContext& ctx, ArgvParser args);

int clear_cache(CliContext& ctx, ArgvParser args);

int compilers(CliContext& ctx, ArgvParser args);

int run(CliContext& ctx, ArgvParser args);

int pair(CliContext& ctx, ArgvParser args);

int install(CliContext& ctx, ArgvParser args);

} // namespace commands
