#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <chrono>
#include <vector>

#include <csignal>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

static std::string find_taskrun_bin() {
    if (const char* env = std::getenv("TASKRUN_BIN")) {
        if (env[0] != '\0' && fs::exists(env)) {
            return fs::absolute(env).string();
        }
    }

    std::vector<std::string> candidates = {
        "./taskrun",
        "../taskrun",
        "./build/taskrun",
        "../build/taskrun"
    };

    for (const auto& c : candidates) {
        if (fs::exists(c)) {
            return fs::absolute(fs::path(c)).string();
        }
    }

    return {};
}

static fs::path make_workspace(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("taskrun_cli_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir / "project");
    return dir;
}

static void write_file(const fs::path& path, const std::string& content, bool executable = false) {
    fs::create_directories(path.parent_path());
    {
        std::ofstream out(path);
        out << content;
    }
    if (executable) {
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
    }
}

static std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

static int run_cmd(const std::string& cmd) {
    std::cout << "[RUN] " << cmd << std::endl;
    int status = std::system(cmd.c_str());
    if (status == -1) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
}

// Writes a config whose handlers append their name to project/trace.txt
static fs::path write_trace_config(const fs::path& dir, const std::string& tasks_yaml) {
    write_file(dir / "tasks" / "mark" / "run",
               "#!/bin/sh\necho \"$TASKRUN_PARAMS\" >> trace.txt\n", true);
    write_file(dir / "tasks" / "broken" / "run",
               "#!/bin/sh\necho 'broken handler' >&2\nexit 2\n", true);

    fs::path config = dir / "config.yaml";
    write_file(config,
               "project:\n"
               "  name: cli-demo\n"
               "  basePath: " + (dir / "project").string() + "\n"
               "settings:\n"
               "  logFile: " + (dir / "logs" / "runner.log").string() + "\n"
               "tasks:\n" + tasks_yaml);
    return config;
}

void test_help_command() {
    const auto bin = find_taskrun_bin();
    assert(!bin.empty() && "taskrun binary not found; set TASKRUN_BIN");

    int rc = run_cmd("\"" + bin + "\" --help");
    (void)rc;
    assert(rc == 0 && "taskrun --help should exit 0");

    rc = run_cmd("\"" + bin + "\" -V");
    assert(rc == 0 && "taskrun -V should exit 0");
    std::cout << "test_help_command passed\n";
}

void test_unknown_argument() {
    const auto bin = find_taskrun_bin();
    assert(!bin.empty() && "taskrun binary not found; set TASKRUN_BIN");

    int rc = run_cmd("\"" + bin + "\" --unknown-arg");
    (void)rc;
    assert(rc != 0 && "taskrun with unknown args should exit non-zero");
    std::cout << "test_unknown_argument passed\n";
}

void test_missing_config() {
    const auto bin = find_taskrun_bin();
    assert(!bin.empty() && "taskrun binary not found; set TASKRUN_BIN");

    int rc = run_cmd("\"" + bin + "\" -y -c /nonexistent/taskrun/config.json");
    (void)rc;
    assert(rc != 0 && "taskrun without a config file should exit non-zero");
    std::cout << "test_missing_config passed\n";
}

void test_run_all_tasks() {
    const auto bin = find_taskrun_bin();
    assert(!bin.empty() && "taskrun binary not found; set TASKRUN_BIN");

    fs::path dir = make_workspace("run_all");
    fs::path config = write_trace_config(dir,
        "  - id: first\n"
        "    handler: mark\n"
        "    params: {step: \"${project.name}-1\"}\n"
        "  - id: hello\n"
        "    handler: log\n"
        "    params: {message: \"Hello from ${project.name}\"}\n"
        "  - id: skipped\n"
        "    handler: mark\n"
        "    enabled: false\n"
        "    params: {step: never}\n"
        "  - id: second\n"
        "    handler: mark\n"
        "    params: {step: \"${project.name}-2\"}\n");

    int rc = run_cmd("\"" + bin + "\" -y -c \"" + config.string() + "\"");
    (void)rc;
    assert(rc == 0 && "taskrun -y should exit 0 when every task succeeds");

    const std::string trace = read_file(dir / "project" / "trace.txt");
    assert(trace == "{\"step\":\"cli-demo-1\"}\n{\"step\":\"cli-demo-2\"}\n");
    assert(fs::exists(dir / "logs" / "runner.log"));
    assert(read_file(dir / "logs" / "runner.log").find("Hello from cli-demo") != std::string::npos);

    fs::remove_all(dir);
    std::cout << "test_run_all_tasks passed\n";
}

void test_failing_task_halts() {
    const auto bin = find_taskrun_bin();
    assert(!bin.empty() && "taskrun binary not found; set TASKRUN_BIN");

    fs::path dir = make_workspace("halt");
    fs::path config = write_trace_config(dir,
        "  - id: first\n"
        "    handler: mark\n"
        "    params: {step: 1}\n"
        "  - id: broken\n"
        "  - id: third\n"
        "    handler: mark\n"
        "    params: {step: 3}\n");

    int rc = run_cmd("\"" + bin + "\" -y -c \"" + config.string() + "\"");
    (void)rc;
    assert(rc == 1 && "taskrun should exit 1 after a failed task");
    assert(read_file(dir / "project" / "trace.txt") == "{\"step\":1}\n");
    assert(read_file(dir / "logs" / "runner.log").find("broken handler") != std::string::npos);

    fs::remove_all(dir);
    std::cout << "test_failing_task_halts passed\n";
}

void test_malformed_task_definitions() {
    const auto bin = find_taskrun_bin();
    assert(!bin.empty() && "taskrun binary not found; set TASKRUN_BIN");

    fs::path dir = make_workspace("malformed");
    fs::path config = write_trace_config(dir,
        "  - id: first\n"
        "    handler: mark\n"
        "    params: {step: 1}\n"
        "  - id: second\n"
        "    enabled: false\n"
        "    git: {add: 5}\n");

    int rc = run_cmd("\"" + bin + "\" -y -c \"" + config.string() + "\"");
    (void)rc;
    assert(rc == 0 && "a disabled malformed task should not fail the run");
    assert(read_file(dir / "project" / "trace.txt") == "{\"step\":1}\n");
    fs::remove_all(dir);

    dir = make_workspace("malformed_enabled");
    config = write_trace_config(dir,
        "  - id: first\n"
        "    handler: mark\n"
        "    params: {step: 1}\n"
        "  - id: second\n"
        "    handler: mark\n"
        "    git: {add: 5}\n"
        "  - id: third\n"
        "    handler: mark\n"
        "    params: {step: 3}\n");

    rc = run_cmd("\"" + bin + "\" -y -c \"" + config.string() + "\"");
    assert(rc == 1 && "an enabled malformed task should halt the run when reached");
    assert(read_file(dir / "project" / "trace.txt") == "{\"step\":1}\n");
    const std::string log = read_file(dir / "logs" / "runner.log");
    assert(log.find("Invalid task definition") != std::string::npos);
    assert(log.find("Field 'add' in git") != std::string::npos);

    fs::remove_all(dir);
    std::cout << "test_malformed_task_definitions passed\n";
}

void test_selected_tasks() {
    const auto bin = find_taskrun_bin();
    assert(!bin.empty() && "taskrun binary not found; set TASKRUN_BIN");

    fs::path dir = make_workspace("select");
    fs::path config = write_trace_config(dir,
        "  - id: one\n"
        "    handler: mark\n"
        "    params: {step: 1}\n"
        "  - id: two\n"
        "    handler: mark\n"
        "    params: {step: 2}\n"
        "  - id: three\n"
        "    handler: mark\n"
        "    params: {step: 3}\n");

    int rc = run_cmd("\"" + bin + "\" -y -t three,one -c \"" + config.string() + "\"");
    (void)rc;
    assert(rc == 0);
    assert(read_file(dir / "project" / "trace.txt") == "{\"step\":1}\n{\"step\":3}\n");

    fs::remove_all(dir);
    std::cout << "test_selected_tasks passed\n";
}

void test_interactive_answers() {
    const auto bin = find_taskrun_bin();
    assert(!bin.empty() && "taskrun binary not found; set TASKRUN_BIN");

    fs::path dir = make_workspace("interactive");
    fs::path config = write_trace_config(dir,
        "  - id: one\n"
        "    handler: mark\n"
        "    params: {step: 1}\n"
        "  - id: two\n"
        "    handler: mark\n"
        "    params: {step: 2}\n");

    // "n" skips the first task, the empty line accepts the default for the second
    int rc = run_cmd("printf 'n\\n\\n' | \"" + bin + "\" -c \"" + config.string() + "\"");
    (void)rc;
    assert(rc == 0);
    assert(read_file(dir / "project" / "trace.txt") == "{\"step\":2}\n");

    // End of input abandons the prompt and nothing runs
    fs::remove(dir / "project" / "trace.txt");
    rc = run_cmd("\"" + bin + "\" -c \"" + config.string() + "\" < /dev/null");
    assert(rc == 0 && "an abandoned prompt should exit 0");
    assert(!fs::exists(dir / "project" / "trace.txt"));

    fs::remove_all(dir);
    std::cout << "test_interactive_answers passed\n";
}

void test_sigterm_handling() {
    const auto bin = find_taskrun_bin();
    assert(!bin.empty() && "taskrun binary not found; set TASKRUN_BIN");

    fs::path dir = make_workspace("sigterm");
    fs::path config = write_trace_config(dir,
        "  - id: wait\n"
        "    handler: shell\n"
        "    params: {command: \"sleep 5\"}\n");

    pid_t pid = fork();
    if (pid == 0) {
        execl(bin.c_str(), bin.c_str(), "-y", "-c", config.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    assert(pid > 0 && "fork failed");
    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    int kill_rc = kill(pid, SIGTERM);
    (void)kill_rc;
    assert(kill_rc == 0 && "Failed to send SIGTERM");

    int status = 0;
    waitpid(pid, &status, 0);

    if (WIFSIGNALED(status)) {
        assert(WTERMSIG(status) == SIGTERM);
    } else if (WIFEXITED(status)) {
        assert(WEXITSTATUS(status) != 0 && "taskrun should exit non-zero on SIGTERM");
    } else {
        assert(false && "Unexpected child status");
    }

    fs::remove_all(dir);
    std::cout << "test_sigterm_handling passed\n";
}

int main() {
    test_help_command();
    test_unknown_argument();
    test_missing_config();
    test_run_all_tasks();
    test_failing_task_halts();
    test_malformed_task_definitions();
    test_selected_tasks();
    test_interactive_answers();
    test_sigterm_handling();
    std::cout << "All taskrun command tests passed.\n";
    return 0;
}
