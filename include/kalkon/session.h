#pragma once

#include <optional>
#include <string>

#include "kalkon/environment.h"
#include "kalkon/evaluator.h"
#include "kalkon/format.h"
#include "kalkon/history.h"
#include "kalkon/result.h"

namespace kalkon {

struct SessionConfig {
    RetentionPolicy retention = RetentionPolicy::unbounded();
    DisplayMode display;
};

enum class InputKind {
    Empty,
    Command,
    Assignment,
    Expression,
};

struct SubmitOutcome {
    InputKind kind = InputKind::Empty;
    // False when the input was rejected; status() then holds the reason and the input line should be kept.
    bool accepted = false;
    std::optional<Value> value;
    std::string variable;
};

// Calculator state behind one front-end: variables, history and display mode.
class Session {
public:
    explicit Session(SessionConfig config = {});

    // Evaluates `text` as it is being typed. Nothing is committed.
    void preview(const std::string& text);
    // Evaluates and commits `text`: runs a command, binds a variable or appends to the history.
    SubmitOutcome submit(const std::string& text);

    const std::string& status() const;
    bool isError() const;
    // Result of the last preview or submit of a plain expression, already wrapped to the integer type.
    const std::optional<EvaluationResult>& current() const;
    // Reports (and resets) whether the history changed since the last call.
    bool takeHistoryUpdated();

    std::string format(const Value& value) const;

    const DisplayMode& displayMode() const;
    const HistoryStore& history() const;
    const Environment& environment() const;
    void clearHistory();

    static bool isCommand(const std::string& text);
    // `:history` and `:vars` change nothing here; the front-end prints the listing.
    static bool isListingCommand(const std::string& text);

private:
    SubmitOutcome process(const std::string& text, bool enter);
    SubmitOutcome processCommand(const std::string& command, bool enter);
    void reset();

    Environment environment_;
    HistoryStore history_;
    Evaluator evaluator_;
    DisplayMode display_;

    std::string status_;
    bool error_;
    bool history_updated_;
    std::optional<EvaluationResult> current_;
};

}  // namespace kalkon
