#pragma once

#include "Task.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <string>

enum class Confirmation {
    Run,
    Skip,   // Operator answered no; only this task is skipped
    Abort   // Operator abandoned the prompt; the whole run ends with success
};

// Yes/no question source. std::nullopt means the prompt itself was abandoned.
class ConfirmationPrompt {
public:
    virtual ~ConfirmationPrompt() = default;
    virtual std::optional<bool> ask(const std::string& question, bool default_answer) = 0;
};

// Reads answers line by line. End of input or SIGINT while waiting abandons the prompt.
class TerminalPrompt : public ConfirmationPrompt {
public:
    explicit TerminalPrompt(std::istream& in = std::cin, std::ostream& out = std::cout)
        : in_(in), out_(out) {}

    std::optional<bool> ask(const std::string& question, bool default_answer) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

class ConfirmationGate {
public:
    // With bypass set the prompt is never consulted
    ConfirmationGate(bool bypass, std::unique_ptr<ConfirmationPrompt> prompt);

    Confirmation confirm(const Task& task);

    bool bypassed() const { return bypass_; }

    static std::string question_for(const Task& task, bool colored = false);

private:
    bool bypass_;
    std::unique_ptr<ConfirmationPrompt> prompt_;
};
