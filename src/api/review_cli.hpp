#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "core/engine_error.hpp"

namespace api {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitSnapshotFailure = 2;
inline constexpr int kExitUsage = 3;
inline constexpr int kExitIoError = 4;
inline constexpr int kExitCorrupt = 5;

int exit_code_for(core::ErrorKind kind) noexcept;

// Environment the CLI honours; read once in main so tests can inject it.
struct CliEnvironment {
    std::optional<std::string> workspace;   // SNAPGATE_WORKSPACE
    std::optional<std::string> update_mode; // SNAPGATE_UPDATE
};

CliEnvironment read_cli_environment();

// `args` excludes the program name: {"review", "--root", "tests", ...}.
int run_snapgate_cli(const std::vector<std::string>& args,
                     const CliEnvironment& env,
                     std::istream& in,
                     std::ostream& out,
                     std::ostream& err);

int run_snapgate_main(int argc, char** argv);

} // namespace api
