#include "commands.hh"

#include <cstdio>
#include <oirun/macros/stack_unwinding.hh>

namespace commands {

void help(const char* program_name) {
    STACK_UNWINDING_MARK;

    if (program_name == nullptr) {
        program_name = "oirun";
    }

    printf("Usage: %s [options] <command> [<command args>]\n", program_name);
    puts(R"==(Oirun compiles and runs competitive programming solutions under time and
memory limits, natively or inside a container

Commands:
  clear-cache           Forget the detected compilers
  compilers <c|cpp>     Print compilers able to build the language, best first
  detect [--rescan]     Print compilers found on this machine. With --rescan
                          the cached result is ignored
  help                  Display this information
  install [--manual]    Install the LLVM toolchain automatically. With --manual
                          (or if the automatic installation fails) print the
                          installation guide instead
  pair <a> <b> [<run options>]
                        Run two solutions on the same input and compare their
                          outputs. Exits with 0 if the outputs are equal and 2
                          otherwise
  run <source> [<run options>]
                        Compile (if needed) and run the source. Exits with 0 if
                          the verdict is AC and 2 otherwise
  version               Display version

Run options:
  --backend <name>      native or container (default: from config)
  --compiler <path>     Use this compiler instead of the recommended one
  --input <file>        Standard input of the program, - means stdin
  --lang <language>     c, cpp or python (default: from the file extension)
  --memory <MiB>        Memory limit
  --opt <level>         Optimization level: O0, O1, O2, O3 or Os
  --std <standard>      Language standard, e.g. c++17 or c11
  --time <seconds>      Time limit (wall clock)

Options:
  -C <directory>        Change working directory to <directory> before doing
                          anything
  --config <file>       Use this config file (default: $OIRUN_CONFIG, then
                          ~/.config/oirun/oirun.conf)
  --json                Print results as JSON
  -h, --help            Display this information
  -V, --version         Display version
  -v, --verbose         Verbose mode
  -q, --quiet           Quiet mode

Verdicts:
  AC                    Accepted: the program exited normally
  COMPILE_ERROR         The compilation failed
  TLE                   Time limit exceeded
  MLE                   Memory limit exceeded
  RE                    Runtime error: non-zero exit code, a signal or no disk
                          space left
  SYSTEM_ERROR          The program could not be run (no compiler, docker
                          unavailable, ...))==");
}

} // namespace commands
