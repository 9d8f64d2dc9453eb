#pragma once
#include <string>
#include "planner.hpp"

struct CommandLine {
    std::string input;
    std::string output;
    PlannerOptions opts;
};

// input.json output.json [--workers N] [--max-orders N], flags in any position.
bool parse_command_line(int argc, const char* const* argv, CommandLine& cmd, std::string& error);
