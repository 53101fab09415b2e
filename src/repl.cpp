#include "kalkon/repl.h"

#include <cctype>
#include <fstream>
#include <ostream>
#include <string>

#include <fmt/format.h>

#include "kalkon/evaluator.h"

namespace kalkon {

namespace {

std::string trim(const std::string& value) {
    std::size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }

    std::size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }

    return value.substr(start, end - start);
}

std::string modeLine(const DisplayMode& mode) {
    return fmt::format("mode: {} {}", valueSystemName(mode.system), integerTypeName(mode.type));
}

// Points at the offending character of a syntax error, below the echoed input.
void printCaret(const std::string& line, std::size_t position, std::ostream& error) {
    error << "  " << line << '\n';
    error << "  " << std::string(position < line.size() ? position : line.size(), ' ') << "^\n";
}

}  // namespace

int Repl::runInteractive(Session& session, std::istream& input, std::ostream& output, std::ostream& error) const {
    output << "kalkon. Type 'help' for usage, 'exit' to quit.\n";

    std::string line;
    while (true) {
        output << "kalkon> " << std::flush;
        if (!std::getline(input, line)) {
            output << "\n";
            break;
        }

        const std::string command = trim(line);
        if (command.empty()) {
            continue;
        }
        if (command == "exit" || command == "quit") {
            break;
        }
        if (command == "help") {
            printHelp(output);
            continue;
        }
        if (printListing(session, command, output)) {
            continue;
        }

        const SubmitOutcome outcome = session.submit(command);
        if (!report(session, command, outcome, output, error)) {
            const auto& current = session.current();
            if (current && !current->ok() && current->failure().position) {
                printCaret(command, *current->failure().position, error);
            }
        }
    }

    return 0;
}

int Repl::runFile(Session& session, const std::string& file_path, std::ostream& output, std::ostream& error) const {
    std::ifstream file(file_path);
    if (!file) {
        error << "Unable to open file: " << file_path << '\n';
        return 1;
    }
    return runStream(session, file, output, error);
}

int Repl::runStream(Session& session, std::istream& input, std::ostream& output, std::ostream& error) const {
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        const std::string expression = trim(line);
        if (expression.empty() || expression[0] == '#') {
            continue;
        }
        if (printListing(session, expression, output)) {
            continue;
        }

        const SubmitOutcome outcome = session.submit(expression);
        if (!outcome.accepted) {
            error << "Line " << line_number << ": " << session.status() << '\n';
            return 1;
        }
        report(session, expression, outcome, output, error);
    }

    return 0;
}

bool Repl::report(const Session& session,
                  const std::string& line,
                  const SubmitOutcome& outcome,
                  std::ostream& output,
                  std::ostream& error) const {
    if (!outcome.accepted) {
        error << session.status() << '\n';
        return false;
    }

    switch (outcome.kind) {
        case InputKind::Command:
            if (line == ":clear") {
                output << "history cleared\n";
            } else {
                output << modeLine(session.displayMode()) << '\n';
            }
            break;
        case InputKind::Assignment:
            output << outcome.variable << " = " << session.format(*outcome.value) << '\n';
            break;
        case InputKind::Expression:
            output << session.format(*outcome.value) << '\n';
            break;
        case InputKind::Empty:
            break;
    }
    return true;
}

bool Repl::printListing(const Session& session, const std::string& command, std::ostream& output) const {
    if (!Session::isListingCommand(command)) {
        return false;
    }
    if (command == ":history") {
        printHistory(session, output);
    } else {
        printVariables(session, output);
    }
    return true;
}

void Repl::printHistory(const Session& session, std::ostream& output) {
    const HistoryStore& history = session.history();
    if (history.empty()) {
        output << "(history is empty)\n";
        return;
    }
    for (const HistoryEntry& entry : history.list()) {
        const std::string result = entry.result().ok() ? session.format(entry.result().value())
                                                       : entry.result().failure().message;
        output << fmt::format("  ${:<4} {} = {}\n", entry.index(), entry.expression(), result);
    }
}

void Repl::printVariables(const Session& session, std::ostream& output) {
    const auto& variables = session.environment().variables();
    if (variables.empty()) {
        output << "(no variables)\n";
        return;
    }
    for (const auto& variable : variables) {
        output << "  " << variable.first << " = " << session.format(variable.second) << '\n';
    }
}

void Repl::printHelp(std::ostream& output) {
    output << "Commands:\n";
    output << "  help        Show this message\n";
    output << "  exit, quit  Leave the REPL\n";
    output << "  :history    List previous results\n";
    output << "  :vars       List variables\n";
    output << "  :clear      Clear the history\n";
    output << "  :dec :hex :bin                         Display system\n";
    output << "  :int :i8 :i16 :i32 :i64 :u8 :u16 :u32 :u64  Integer type\n\n";
    output << "Features:\n";
    output << "  Operators: + - * / % ^ (or **), bitwise & | ~ << >>\n";
    output << "  Literals: 42, 3.14, 1e-3, 0x1f, 0b101\n";
    output << "  Parentheses and unary minus\n";
    output << "  Functions:";
    for (const std::string& name : Evaluator::functionNames()) {
        output << ' ' << name;
    }
    output << '\n';
    output << "  Variables: x = 3.14\n";
    output << "  Constants: pi, tau, e, inf, nan\n";
    output << "  History: $1, $2, ... (numbered as listed by :history)\n";
}

}  // namespace kalkon
