#include <iostream>
#include <cassert>
#include <deque>
#include <sstream>
#include "ConfirmationGate.hpp"

namespace {

// Replays scripted answers and records every question
class ScriptedPrompt : public ConfirmationPrompt {
public:
    ScriptedPrompt(std::deque<std::optional<bool>> answers, std::vector<std::string>& questions)
        : answers_(std::move(answers)), questions_(questions) {}

    std::optional<bool> ask(const std::string& question, bool default_answer) override {
        assert(default_answer);
        questions_.push_back(question);
        assert(!answers_.empty());
        auto answer = answers_.front();
        answers_.pop_front();
        return answer;
    }

private:
    std::deque<std::optional<bool>> answers_;
    std::vector<std::string>& questions_;
};

Task make_task(const std::string& id, std::optional<std::string> description = std::nullopt) {
    Task task;
    task.id = id;
    task.description = std::move(description);
    return task;
}

}

void test_question_text() {
    assert(ConfirmationGate::question_for(make_task("build", "Build the site")) == "Run task 'build' (Build the site)?");
    assert(ConfirmationGate::question_for(make_task("lint")) == "Run task 'lint'?");

    std::string colored = ConfirmationGate::question_for(make_task("lint"), true);
    assert(colored.find("lint") != std::string::npos);
    assert(colored.find("\x1b[") != std::string::npos);
    std::cout << "test_question_text passed\n";
}

void test_bypass_never_prompts() {
    std::vector<std::string> questions;
    ConfirmationGate gate(true, std::make_unique<ScriptedPrompt>(std::deque<std::optional<bool>>{}, questions));

    assert(gate.bypassed());
    assert(gate.confirm(make_task("a")) == Confirmation::Run);
    assert(gate.confirm(make_task("b")) == Confirmation::Run);
    assert(questions.empty());

    ConfirmationGate no_prompt(true, nullptr);
    assert(no_prompt.confirm(make_task("a")) == Confirmation::Run);
    std::cout << "test_bypass_never_prompts passed\n";
}

void test_answers_map_to_decisions() {
    std::vector<std::string> questions;
    ConfirmationGate gate(false, std::make_unique<ScriptedPrompt>(
        std::deque<std::optional<bool>>{true, false, std::nullopt}, questions));

    assert(gate.confirm(make_task("a")) == Confirmation::Run);
    assert(gate.confirm(make_task("b")) == Confirmation::Skip);
    assert(gate.confirm(make_task("c")) == Confirmation::Abort);
    assert(questions.size() == 3);
    std::cout << "test_answers_map_to_decisions passed\n";
}

void test_missing_prompt_rejected() {
    try {
        ConfirmationGate gate(false, nullptr);
        assert(false && "Should throw without a prompt");
    } catch (const std::invalid_argument&) {
    }
    std::cout << "test_missing_prompt_rejected passed\n";
}

void test_terminal_prompt_answers() {
    std::istringstream in("\nY\nno\n yes \nn\n");
    std::ostringstream out;
    TerminalPrompt prompt(in, out);

    assert(prompt.ask("Run task 'a'?", true) == std::optional<bool>(true));
    assert(prompt.ask("Run task 'a'?", true) == std::optional<bool>(true));
    assert(prompt.ask("Run task 'a'?", true) == std::optional<bool>(false));
    assert(prompt.ask("Run task 'a'?", false) == std::optional<bool>(true));
    assert(prompt.ask("Run task 'a'?", true) == std::optional<bool>(false));

    const std::string shown = out.str();
    assert(shown.find("? Run task 'a'? (Y/n) ") != std::string::npos);
    assert(shown.find("(y/N)") != std::string::npos);
    std::cout << "test_terminal_prompt_answers passed\n";
}

void test_terminal_prompt_reasks_and_eof() {
    std::istringstream in("maybe\nsure\n");
    std::ostringstream out;
    TerminalPrompt prompt(in, out);

    // Two unrecognized answers, then end of input
    assert(!prompt.ask("Run task 'x'?", true).has_value());

    const std::string shown = out.str();
    size_t first = shown.find("Please answer yes or no.");
    assert(first != std::string::npos);
    assert(shown.find("Please answer yes or no.", first + 1) != std::string::npos);

    std::istringstream empty;
    TerminalPrompt closed(empty, out);
    assert(!closed.ask("Run task 'x'?", false).has_value());
    std::cout << "test_terminal_prompt_reasks_and_eof passed\n";
}

void test_terminal_prompt_empty_uses_default() {
    std::istringstream in("\n   \n");
    std::ostringstream out;
    TerminalPrompt prompt(in, out);

    assert(prompt.ask("q", false) == std::optional<bool>(false));
    assert(prompt.ask("q", true) == std::optional<bool>(true));
    std::cout << "test_terminal_prompt_empty_uses_default passed\n";
}

int main() {
    test_question_text();
    test_bypass_never_prompts();
    test_answers_map_to_decisions();
    test_missing_prompt_rejected();
    test_terminal_prompt_answers();
    test_terminal_prompt_reasks_and_eof();
    test_terminal_prompt_empty_uses_default();

    std::cout << "All ConfirmationGate tests passed!\n";
    return 0;
}
