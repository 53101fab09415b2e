#pragma once

#include <iosfwd>
#include <string>

#include "kalkon/session.h"

namespace kalkon {

class Repl {
public:
    int runInteractive(Session& session, std::istream& input, std::ostream& output, std::ostream& error) const;
    int runFile(Session& session, const std::string& file_path, std::ostream& output, std::ostream& error) const;
    // Batch mode over an already opened stream. Stops at the first rejected line and returns 1.
    int runStream(Session& session, std::istream& input, std::ostream& output, std::ostream& error) const;

    static void printHelp(std::ostream& output);
    static void printHistory(const Session& session, std::ostream& output);
    static void printVariables(const Session& session, std::ostream& output);

private:
    // Prints what a submitted line produced. Returns false if the session rejected it.
    bool report(const Session& session,
                const std::string& line,
                const SubmitOutcome& outcome,
                std::ostream& output,
                std::ostream& error) const;
    // Handles `:history` and `:vars`. Returns false for any other line.
    bool printListing(const Session& session, const std::string& command, std::ostream& output) const;
};

}  // namespace kalkon
