#include "steward/process.hpp"
#include "steward/platform.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace steward {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kPollIntervalMs = 50;

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    auto current = get_all_env();
    for (const auto& [key, value] : overrides) {
        current[key] = value;
    }

    std::vector<std::string> env;
    env.reserve(current.size());
    for (const auto& [key, value] : current) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(const_cast<char*>(s.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

bool is_executable_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

} // namespace

std::optional<std::string> find_executable(const std::string& name, const std::string& path_var) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) return name;
        return std::nullopt;
    }

    std::stringstream ss(path_var);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate)) return candidate;
    }
    return std::nullopt;
}

CommandResult run_command(const std::vector<std::string>& argv_in, int timeout_ms) {
    CommandResult result;

    if (argv_in.empty()) {
        result.error = "empty command";
        return result;
    }

    auto binary = find_executable(argv_in[0], get_env("PATH").value_or("/usr/bin:/bin"));
    if (!binary) {
        result.error = argv_in[0] + " not found in PATH";
        return result;
    }

    std::vector<std::string> argv_strings = argv_in;
    auto argv = to_c_array(argv_strings);
    std::vector<std::string> env_strings = build_environment({});
    auto envp = to_c_array(env_strings);

    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    pid_t pid = fork();
    if (pid == -1) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);

        execve(binary->c_str(), argv.data(), envp.data());
        _exit(127);
    }

    close(out_pipe[1]);

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    bool eof = false;
    char buf[4096];

    while (!eof) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd pfd;
        pfd.fd = out_pipe[0];
        pfd.events = POLLIN;
        int rc = poll(&pfd, 1, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        ssize_t n = read(out_pipe[0], buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            eof = true;
        } else if (errno != EINTR) {
            break;
        }
    }
    close(out_pipe[0]);

    if (result.timed_out) {
        kill(pid, SIGKILL);
        int status = 0;
        waitpid(pid, &status, 0);
        result.error = "timed out after " + std::to_string(timeout_ms) + "ms";
        return result;
    }

    // Output closed; the child may still be exiting
    int status = 0;
    pid_t waited = 0;
    while ((waited = waitpid(pid, &status, WNOHANG)) == 0) {
        if (Clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.timed_out = true;
            result.error = "timed out after " + std::to_string(timeout_ms) + "ms";
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (waited < 0) {
        result.error = "waitpid failed: " + std::string(strerror(errno));
        return result;
    }

    result.exit_code = decode_wait_status(status);
    result.ok = true;
    return result;
}

SpawnResult spawn_detached(const std::string& binary,
                           const std::vector<std::string>& args,
                           const std::map<std::string, std::string>& env) {
    SpawnResult result;

    std::vector<std::string> argv_strings;
    argv_strings.push_back(binary);
    for (const auto& arg : args) {
        argv_strings.push_back(arg);
    }
    auto argv = to_c_array(argv_strings);

    std::vector<std::string> env_strings = build_environment(env);
    auto envp = to_c_array(env_strings);

    int stdin_pipe[2];
    if (pipe(stdin_pipe) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    pid_t pid = fork();
    if (pid == -1) {
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        setsid();

        if (stdin_pipe[0] != STDIN_FILENO) {
            dup2(stdin_pipe[0], STDIN_FILENO);
            close(stdin_pipe[0]);
        }
        // stdin_pipe[1] stays open in the child

        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }

        execve(binary.c_str(), argv.data(), envp.data());
        _exit(127);
    }

    close(stdin_pipe[0]);
    close(stdin_pipe[1]);

    result.ok = true;
    result.pid = pid;
    return result;
}

std::optional<int> try_reap(int pid) {
    if (pid <= 0) return std::nullopt;

    int status = 0;
    pid_t rc = waitpid(pid, &status, WNOHANG);
    if (rc == pid) {
        return decode_wait_status(status);
    }
    return std::nullopt;
}

bool process_alive(int pid) {
    if (pid <= 0) return false;

    if (try_reap(pid)) return false;

    if (kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

Result<void> send_signal(int pid, int sig, bool whole_group) {
    if (pid <= 0) {
        return Result<void>::err(Error(ErrorCode::PROCESS_ERROR, "invalid pid " + std::to_string(pid)));
    }
    pid_t target = pid;
    if (whole_group && getpgid(pid) == pid) {
        target = -pid;
    }
    if (kill(target, sig) != 0) {
        if (errno == ESRCH) return Result<void>::ok();
        return Result<void>::err(Error(ErrorCode::PROCESS_ERROR,
            "kill(" + std::to_string(pid) + ", " + std::to_string(sig) + ") failed: " + strerror(errno)));
    }
    return Result<void>::ok();
}

bool wait_for_exit(int pid, int timeout_ms) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    while (process_alive(pid)) {
        if (Clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
    }
    return true;
}

} // namespace steward
