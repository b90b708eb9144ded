#pragma once

#include "tutorplane/control/control_plane.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>

namespace tutorplane::cli {

int run_cli(int argc, char **argv);
void print_help();

/// Executes one JSON-encoded ActionPlan and returns the envelope as one line
/// of JSON. Malformed input yields a rejected envelope, never an exception.
[[nodiscard]] std::string handle_plan_line(control::ControlPlane &plane, const std::string &line);

/// JSON lines in, JSON lines out, until end of input. Blank lines are skipped.
/// Returns the number of plans handled.
std::size_t serve_stream(control::ControlPlane &plane, std::istream &in, std::ostream &out);

} // namespace tutorplane::cli
