#include "kalkon/session.h"

#include <cctype>
#include <utility>

#include <fmt/format.h>

#include "kalkon/expression.h"

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

std::string describe(const Failure& failure) {
    return fmt::format("{}: {}", errorKindToString(failure.kind), failure.message);
}

}  // namespace

Session::Session(SessionConfig config)
    : history_(config.retention), display_(config.display), error_(false), history_updated_(false) {}

void Session::preview(const std::string& text) {
    process(text, false);
}

SubmitOutcome Session::submit(const std::string& text) {
    return process(text, true);
}

const std::string& Session::status() const {
    return status_;
}

bool Session::isError() const {
    return error_;
}

const std::optional<EvaluationResult>& Session::current() const {
    return current_;
}

bool Session::takeHistoryUpdated() {
    const bool updated = history_updated_;
    history_updated_ = false;
    return updated;
}

std::string Session::format(const Value& value) const {
    return formatValue(value, display_);
}

const DisplayMode& Session::displayMode() const {
    return display_;
}

const HistoryStore& Session::history() const {
    return history_;
}

const Environment& Session::environment() const {
    return environment_;
}

void Session::clearHistory() {
    history_.clear();
    history_updated_ = true;
}

bool Session::isCommand(const std::string& text) {
    const std::string command = trim(text);
    if (command.size() < 2 || command[0] != ':') {
        return false;
    }
    const std::string name = command.substr(1);
    return name == "clear" || valueSystemFromName(name) || integerTypeFromName(name) || isListingCommand(command);
}

bool Session::isListingCommand(const std::string& text) {
    const std::string command = trim(text);
    return command == ":history" || command == ":vars";
}

void Session::reset() {
    status_.clear();
    error_ = false;
    current_.reset();
}

SubmitOutcome Session::process(const std::string& text, bool enter) {
    reset();

    const std::string line = trim(text);
    if (!line.empty() && line[0] == ':') {
        return processCommand(line, enter);
    }

    SubmitOutcome outcome;
    if (line.empty()) {
        if (enter) {
            status_ = "Empty expression";
            error_ = true;
        }
        return outcome;
    }

    const Expression expression(line);
    const EvaluationResult result = evaluator_.evaluate(expression, environment_, history_);
    outcome.kind = expression.isAssignment() ? InputKind::Assignment : InputKind::Expression;

    if (!result.ok()) {
        status_ = describe(result.failure());
        error_ = true;
        current_ = result;
        return outcome;
    }

    const Value value = wrapValue(result.value(), display_.type);
    outcome.value = value;

    if (outcome.kind == InputKind::Assignment) {
        outcome.variable = *expression.statement().target;
        status_ = fmt::format("Set {}", line);
        if (enter) {
            environment_.setVariable(outcome.variable, value);
            outcome.accepted = true;
        }
        return outcome;
    }

    current_ = EvaluationResult(value);
    if (enter) {
        history_.append(line, *current_);
        history_updated_ = true;
        outcome.accepted = true;
    }
    return outcome;
}

SubmitOutcome Session::processCommand(const std::string& command, bool enter) {
    SubmitOutcome outcome;
    outcome.kind = InputKind::Command;

    if (!isCommand(command)) {
        status_ = fmt::format("Unknown command '{}'", command);
        error_ = true;
        return outcome;
    }
    if (!enter) {
        status_ = fmt::format("CMD: {}", command);
        return outcome;
    }

    const std::string name = command.substr(1);
    if (name == "clear") {
        clearHistory();
    } else if (const auto system = valueSystemFromName(name)) {
        display_.system = *system;
    } else if (const auto type = integerTypeFromName(name)) {
        display_.type = *type;
    }
    outcome.accepted = true;
    return outcome;
}

}  // namespace kalkon
