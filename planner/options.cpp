#include "options.hpp"
#include <stdexcept>
#include <vector>
using namespace std;

// Whole-argument integer; "4x" or "" is rejected.
static bool parse_int(const string& text, int& out)
{
    size_t pos = 0;
    try {
        out = stoi(text, &pos);
    } catch (const exception&) {
        return false;
    }
    return pos == text.size();
}

bool parse_command_line(int argc, const char* const* argv, CommandLine& cmd, string& error)
{
    cmd = CommandLine();
    vector<string> positional;

    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            positional.push_back(arg);
            continue;
        }

        if (arg != "--workers" && arg != "--max-orders") {
            error = "unknown option " + arg;
            return false;
        }
        if (i + 1 >= argc) {
            error = "missing value for " + arg;
            return false;
        }

        string text = argv[++i];
        int value;
        if (!parse_int(text, value)) {
            error = "invalid value for " + arg + ": " + text;
            return false;
        }

        if (arg == "--workers") {
            if (value < 1) {
                error = "--workers must be at least 1";
                return false;
            }
            cmd.opts.workers = value;
        } else {
            if (value < 0) {
                error = "--max-orders must not be negative";
                return false;
            }
            cmd.opts.max_orders = value;
        }
    }

    if (positional.size() != 2) {
        error = "expected input and output files, got " + to_string(positional.size()) + " paths";
        return false;
    }
    cmd.input = positional[0];
    cmd.output = positional[1];
    return true;
}
