#pragma once

#include "skytest/engine.h"

#include <ostream>
#include <span>

namespace skytest {

inline constexpr int kExitOk       = 0;
inline constexpr int kExitFailures = 1;
inline constexpr int kExitUsage    = 2;

// Command-line entry point for embedders that provide a Starlark engine.
// Parses `args` (argv[0] is skipped when it does not look like an option),
// runs the selected files once or in watch mode and writes reports to `out`.
// Returns kExitOk, kExitFailures or kExitUsage (bad usage or a file error).
//
// With -j N the engine's exec_file and callables are invoked from several
// threads at once, one file per thread.
int run_all(Engine &engine, std::span<const char *> args, std::ostream &out);
int run_all(Engine &engine, int argc, char **argv);

} // namespace skytest
