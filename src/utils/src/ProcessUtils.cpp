#include "ProcessUtils.hpp"
#include <cerrno>
#include <cstring>
#include <string>
#include <sstream>
#include <system_error>
#include <vector>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace ProcessUtils {

namespace {

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }

    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read;
    UniqueFd write;

    void open() {
        int fds[2] = {-1, -1};
        if (::pipe(fds) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe");
        }
        read.reset(fds[0]);
        write.reset(fds[1]);
    }
};

// Only async-signal-safe calls past this point: the parent may own other threads
[[noreturn]] void exec_child(const Pipe& out, const Pipe& err, const std::string& working_dir,
                             const char* path, char* const argv[], char* const envp[]) {
    ::dup2(out.write.get(), STDOUT_FILENO);
    ::dup2(err.write.get(), STDERR_FILENO);
    ::close(out.read.get());
    ::close(err.read.get());
    ::close(out.write.get());
    ::close(err.write.get());

    if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
        static const char msg[] = "cannot change to working directory\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        ::_exit(127);
    }

    ::execve(path, argv, envp);

    static const char msg[] = "exec failed\n";
    ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    ::_exit(127);
}

void drain(Pipe& out, Pipe& err, CommandResult& result) {
    struct pollfd fds[2] = {
        {out.read.get(), POLLIN, 0},
        {err.read.get(), POLLIN, 0}
    };
    std::string* targets[2] = {&result.stdout_text, &result.stderr_text};
    int open_count = 2;
    char buf[4096];

    while (open_count > 0) {
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "poll");
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                targets[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
}

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

CommandResult spawn(const std::string& path,
                    const std::vector<std::string>& argv_strings,
                    const std::string& working_dir,
                    const std::vector<std::string>& env_strings) {
    std::vector<char*> argv;
    for (const auto& arg : argv_strings) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (const auto& entry : env_strings) envp.push_back(const_cast<char*>(entry.c_str()));
    envp.push_back(nullptr);

    Pipe out, err;
    out.open();
    err.open();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }
    if (pid == 0) {
        exec_child(out, err, working_dir, path.c_str(), argv.data(), envp.data());
    }

    out.write.reset();
    err.write.reset();

    CommandResult result;
    drain(out, err, result);
    result.exit_code = wait_child(pid);
    return result;
}

std::vector<std::string> inherited_environment() {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        env.emplace_back(*entry);
    }
    return env;
}

}

CommandResult run_shell(const std::string& command, const std::string& working_dir) {
    return spawn("/bin/sh", {"sh", "-c", command}, working_dir, inherited_environment());
}

CommandResult run_program(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::string& working_dir,
                          const EnvList& extra_env) {
    std::vector<std::string> argv{program};
    argv.insert(argv.end(), args.begin(), args.end());

    std::vector<std::string> env;
    for (auto& entry : inherited_environment()) {
        bool overridden = false;
        for (const auto& [name, value] : extra_env) {
            (void)value;
            if (entry.compare(0, name.size() + 1, name + "=") == 0) {
                overridden = true;
                break;
            }
        }
        if (!overridden) env.push_back(std::move(entry));
    }
    for (const auto& [name, value] : extra_env) {
        env.push_back(name + "=" + value);
    }

    return spawn(program, argv, working_dir, env);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

} // namespace ProcessUtils
