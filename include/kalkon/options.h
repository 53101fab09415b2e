#pragma once

#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "kalkon/session.h"

namespace kalkon {

class OptionsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Options {
    SessionConfig session;
    std::optional<std::string> file;
    bool show_help = false;
};

// Parses the arguments after the program name. Throws OptionsError on bad input.
Options parseOptions(const std::vector<std::string>& args);

void printUsage(std::ostream& output);

}  // namespace kalkon
