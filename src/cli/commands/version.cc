#include "commands.hh"

#include <cstdio>

namespace commands {

void version() { puts("oirun version " OIRUN_VERSION); }

} // namespace commands
