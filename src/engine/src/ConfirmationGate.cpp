#include "ConfirmationGate.hpp"
#include "SignalManager.hpp"
#include "StringUtils.hpp"
#include <fmt/color.h>
#include <fmt/format.h>
#include <stdexcept>
#include <unistd.h>

std::optional<bool> TerminalPrompt::ask(const std::string& question, bool default_answer) {
    SignalManager::InterruptScope interrupt;

    while (true) {
        out_ << "? " << question << (default_answer ? " (Y/n) " : " (y/N) ") << std::flush;

        std::string line;
        if (!std::getline(in_, line) || interrupt.interrupted()) {
            out_ << std::endl;
            return std::nullopt;
        }

        StringUtils::trim(line);
        const std::string answer = StringUtils::to_lower(line);
        if (answer.empty()) return default_answer;
        if (answer == "y" || answer == "yes") return true;
        if (answer == "n" || answer == "no") return false;

        out_ << "Please answer yes or no." << std::endl;
    }
}

ConfirmationGate::ConfirmationGate(bool bypass, std::unique_ptr<ConfirmationPrompt> prompt)
    : bypass_(bypass), prompt_(std::move(prompt)) {
    if (!bypass_ && !prompt_) {
        throw std::invalid_argument("ConfirmationGate needs a prompt unless confirmations are bypassed");
    }
}

std::string ConfirmationGate::question_for(const Task& task, bool colored) {
    std::string id = colored
        ? fmt::format(fmt::fg(fmt::terminal_color::cyan), "{}", task.id)
        : task.id;

    if (task.description) {
        return fmt::format("Run task '{}' ({})?", id, *task.description);
    }
    return fmt::format("Run task '{}'?", id);
}

Confirmation ConfirmationGate::confirm(const Task& task) {
    if (bypass_) return Confirmation::Run;

    auto answer = prompt_->ask(question_for(task, ::isatty(STDOUT_FILENO) == 1), true);
    if (!answer) return Confirmation::Abort;
    return *answer ? Confirmation::Run : Confirmation::Skip;
}
