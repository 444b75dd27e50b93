// =================================================================
// src/Packwright/ProcessSupervisor.cpp
// =================================================================
// Implementation for supervised execution of external tools.

#include "Packwright/ProcessSupervisor.hpp"
#include "Packwright/Environment.hpp"
#include "Packwright/Errors.hpp"
#include "Packwright/Logger.hpp"
#include <chrono>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

extern char** environ;

namespace Packwright {

namespace {

std::vector<std::regex> compilePatterns(const std::vector<std::string>& patterns) {
    std::vector<std::regex> compiled;
    for (const auto& pattern : patterns) {
        try {
            compiled.emplace_back(pattern, std::regex_constants::ECMAScript);
        } catch (const std::regex_error& e) {
            throw UserError("Invalid output pattern '" + pattern + "': " + e.what());
        }
    }
    return compiled;
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::vector<char*> toCharArray(const std::vector<std::string>& strings) {
    std::vector<char*> result;
    result.reserve(strings.size() + 1);
    for (const auto& s : strings) {
        result.push_back(const_cast<char*>(s.c_str()));
    }
    result.push_back(nullptr);
    return result;
}

std::vector<std::string> buildEnvironment(const ToolInvocation& invocation) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string pair = *entry;
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[pair.substr(0, eq)] = pair.substr(eq + 1);
    }
    for (const auto& name : invocation.env_unset) {
        merged.erase(name);
    }
    for (const auto& [name, value] : invocation.env_overlay) {
        merged[name] = value;
    }

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& [name, value] : merged) {
        result.push_back(name + "=" + value);
    }
    return result;
}

#ifndef __linux__
// Without pipe2, descriptor creation and fork must not interleave
std::mutex g_spawn_mutex;
#endif

void openPipe(int fds[2]) {
#ifdef __linux__
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("Failed to create pipe: ") + std::strerror(errno));
    }
#else
    std::lock_guard<std::mutex> lock(g_spawn_mutex);
    if (pipe(fds) != 0) {
        throw std::runtime_error(std::string("Failed to create pipe: ") + std::strerror(errno));
    }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
}

pid_t forkChild() {
#ifndef __linux__
    std::lock_guard<std::mutex> lock(g_spawn_mutex);
#endif
    return fork();
}

// Move the terminal's foreground to a process group without being stopped by SIGTTOU
void setForegroundGroup(pid_t pgid) {
    struct sigaction ignore{};
    struct sigaction previous{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGTTOU, &ignore, &previous);
    tcsetpgrp(STDIN_FILENO, pgid);
    sigaction(SIGTTOU, &previous, nullptr);
}

// Write a pre-built message from the forked child; only async-signal-safe calls
void childFail(const std::string& message) {
    ssize_t ignored = write(STDERR_FILENO, message.data(), message.size());
    (void)ignored;
    _exit(127);
}

} // anonymous namespace

std::string runOutcomeToString(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::SUCCEEDED: return "succeeded";
        case RunOutcome::FAILED: return "failed";
        case RunOutcome::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

std::string ToolInvocation::commandLine() const {
    std::ostringstream line;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            line << " ";
        }
        if (args[i].empty() || args[i].find_first_of(" \t\"'") != std::string::npos) {
            line << "\"" << args[i] << "\"";
        } else {
            line << args[i];
        }
    }
    return line.str();
}

std::string ToolInvocation::displayName() const {
    if (!tool_name.empty()) {
        return tool_name;
    }
    if (args.empty()) {
        return "<none>";
    }
    return std::filesystem::path(args[0]).filename().string();
}

// OutputClassifier

OutputClassifier::OutputClassifier(const std::vector<std::string>& success_patterns,
                                   const std::vector<std::string>& failure_patterns)
    : m_success(compilePatterns(success_patterns)),
      m_failure(compilePatterns(failure_patterns)) {
}

void OutputClassifier::observe(const std::string& line) {
    if (m_failure_seen) {
        return;
    }

    for (const auto& pattern : m_failure) {
        if (std::regex_search(line, pattern)) {
            m_failure_seen = true;
            m_matched_line = line;
            return;
        }
    }

    if (m_success_seen) {
        return;
    }

    for (const auto& pattern : m_success) {
        if (std::regex_search(line, pattern)) {
            m_success_seen = true;
            m_matched_line = line;
            return;
        }
    }
}

RunOutcome OutputClassifier::verdict(int exit_code) const {
    if (m_failure_seen) {
        return RunOutcome::FAILED;
    }
    if (m_success_seen) {
        return RunOutcome::SUCCEEDED;
    }
    if (!m_success.empty()) {
        return RunOutcome::FAILED;
    }
    return exit_code == 0 ? RunOutcome::SUCCEEDED : RunOutcome::FAILED;
}

// ProcessSupervisor

ProcessSupervisor::ProcessSupervisor(const CancellationToken& token, int verbosity)
    : m_token(token), m_verbosity(verbosity) {
}

ProcessResult ProcessSupervisor::run(const ToolInvocation& invocation) {
    if (invocation.args.empty()) {
        throw UserError("Cannot run an empty command");
    }

    std::string search_path;
    auto path_override = invocation.env_overlay.find("PATH");
    if (path_override != invocation.env_overlay.end()) {
        search_path = path_override->second;
    }
    auto executable = findExecutable(invocation.args[0], search_path);
    if (!executable) {
        throw MissingTool(invocation.displayName(), "'" + invocation.args[0] + "' was not found on PATH");
    }

    std::vector<std::string> argv = invocation.args;
    argv[0] = executable->string();
    std::vector<std::string> envp = buildEnvironment(invocation);

    if (m_verbosity >= 2) {
        auto& logger = Logger::getInstance();
        logger.debug("Process", "Running: " + invocation.commandLine());
        if (!invocation.working_directory.empty()) {
            logger.debug("Process", "Working directory: " + invocation.working_directory);
        }
        for (const auto& [name, value] : invocation.env_overlay) {
            logger.debug("Process", "Environment: " + name + "=" + value);
        }
    }

    if (m_token.isCancelled()) {
        ProcessResult cancelled;
        cancelled.outcome = RunOutcome::CANCELLED;
        return cancelled;
    }

    auto start_time = std::chrono::steady_clock::now();
    ProcessResult result = invocation.mode == StreamMode::INTERACTIVE
        ? runInteractive(invocation, argv, envp)
        : runCaptured(invocation, argv, envp);
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    Logger::getInstance().logToolInvocation(invocation.commandLine(), result.exit_code,
                                            runOutcomeToString(result.outcome),
                                            static_cast<long>(duration.count()));
    return result;
}

std::string ProcessSupervisor::checkOutput(const ToolInvocation& invocation) {
    ToolInvocation captured = invocation;
    captured.mode = StreamMode::CAPTURED;

    ProcessResult result = run(captured);
    if (result.outcome == RunOutcome::CANCELLED) {
        throw Cancelled();
    }
    if (!result.succeeded()) {
        std::string summary;
        if (!result.matched_line.empty()) {
            summary = captured.displayName() + " reported failure: " + result.matched_line;
        }
        throw ToolInvocationFailed(captured.displayName(), result.exit_code, result.output, summary);
    }
    return result.output;
}

ProcessResult ProcessSupervisor::runCaptured(const ToolInvocation& invocation,
                                             const std::vector<std::string>& argv,
                                             const std::vector<std::string>& envp) {
    OutputClassifier classifier(invocation.success_patterns, invocation.failure_patterns);

    int pipe_fds[2];
    openPipe(pipe_fds);

    auto argv_array = toCharArray(argv);
    auto envp_array = toCharArray(envp);
    const char* working_directory = invocation.working_directory.empty()
        ? nullptr : invocation.working_directory.c_str();
    const std::string chdir_error = "packwright: cannot enter " + invocation.working_directory + "\n";
    const std::string exec_error = "packwright: cannot execute " + argv[0] + "\n";

    pid_t pid = forkChild();
    if (pid < 0) {
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        throw std::runtime_error(std::string("Failed to fork: ") + std::strerror(errno));
    }

    if (pid == 0) {
        setpgid(0, 0);
        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
            close(null_fd);
        }
        dup2(pipe_fds[1], STDOUT_FILENO);
        dup2(pipe_fds[1], STDERR_FILENO);
        if (working_directory != nullptr && chdir(working_directory) != 0) {
            childFail(chdir_error);
        }
        execve(argv_array[0], argv_array.data(), envp_array.data());
        childFail(exec_error);
    }

    setpgid(pid, pid);
    close(pipe_fds[1]);

    ProcessResult result;
    std::string pending;
    bool cancelled = false;
    bool reaped = false;
    int status = 0;
    char buffer[4096];

    while (true) {
        if (m_token.isCancelled()) {
            cancelled = true;
            status = terminate(pid, reaped, status);
            reaped = true;
            break;
        }
        if (invocation.stop_on_match && classifier.hasMatch()) {
            status = terminate(pid, reaped, status);
            reaped = true;
            break;
        }

        struct pollfd descriptor{};
        descriptor.fd = pipe_fds[0];
        descriptor.events = POLLIN;
        int ready = poll(&descriptor, 1, 100);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        if (ready == 0) {
            // Child gone but a grandchild still holds the pipe: stop waiting for EOF
            if (reaped) {
                break;
            }
            if (waitpid(pid, &status, WNOHANG) == pid) {
                reaped = true;
            }
            continue;
        }

        ssize_t count = read(pipe_fds[0], buffer, sizeof(buffer));
        if (count < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            break;
        }
        if (count == 0) {
            break;
        }

        pending.append(buffer, static_cast<size_t>(count));
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string raw_line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (!raw_line.empty() && raw_line.back() == '\r') {
                raw_line.pop_back();
            }
            handleLine(invocation, decodeOutput(raw_line), classifier, result.output);
        }
    }
    close(pipe_fds[0]);

    if (!pending.empty()) {
        handleLine(invocation, decodeOutput(pending), classifier, result.output);
    }

    if (!reaped) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }

    result.exit_code = decodeWaitStatus(status);
    result.matched_line = classifier.matchedLine();
    result.outcome = cancelled ? RunOutcome::CANCELLED : classifier.verdict(result.exit_code);
    return result;
}

ProcessResult ProcessSupervisor::runInteractive(const ToolInvocation& invocation,
                                                const std::vector<std::string>& argv,
                                                const std::vector<std::string>& envp) {
    auto argv_array = toCharArray(argv);
    auto envp_array = toCharArray(envp);
    const char* working_directory = invocation.working_directory.empty()
        ? nullptr : invocation.working_directory.c_str();
    const std::string chdir_error = "packwright: cannot enter " + invocation.working_directory + "\n";
    const std::string exec_error = "packwright: cannot execute " + argv[0] + "\n";

    std::cout.flush();
    std::cerr.flush();

    // Only a foreground Packwright can lend the terminal to the tool
    const bool hand_over_terminal = isatty(STDIN_FILENO) && tcgetpgrp(STDIN_FILENO) == getpgrp();

    pid_t pid = forkChild();
    if (pid < 0) {
        throw std::runtime_error(std::string("Failed to fork: ") + std::strerror(errno));
    }
    if (pid == 0) {
        setpgid(0, 0);
        if (hand_over_terminal) {
            setForegroundGroup(getpid());
        }
        if (working_directory != nullptr && chdir(working_directory) != 0) {
            childFail(chdir_error);
        }
        execve(argv_array[0], argv_array.data(), envp_array.data());
        childFail(exec_error);
    }
    setpgid(pid, pid);

    ProcessResult result;
    int status = 0;
    bool cancelled = false;
    while (true) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            break;
        }
        if (m_token.isCancelled()) {
            cancelled = true;
            status = terminate(pid, false, status);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    if (hand_over_terminal) {
        setForegroundGroup(getpgrp());
    }

    result.exit_code = decodeWaitStatus(status);
    // Ctrl-C reaches only the foreground tool, which dies of SIGINT
    if (cancelled || (WIFSIGNALED(status) && WTERMSIG(status) == SIGINT)) {
        result.outcome = RunOutcome::CANCELLED;
    } else {
        result.outcome = result.exit_code == 0 ? RunOutcome::SUCCEEDED : RunOutcome::FAILED;
    }
    return result;
}

int ProcessSupervisor::terminate(int pgid, bool leader_reaped, int leader_status) {
    kill(-pgid, SIGTERM);

    int status = leader_status;
    if (!leader_reaped) {
        bool exited = false;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_termination_grace_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (waitpid(pgid, &status, WNOHANG) == pgid) {
                exited = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        if (!exited) {
            Logger::getInstance().warning("Process", "Tool ignored SIGTERM, killing it",
                                          "pid " + std::to_string(pgid));
            kill(-pgid, SIGKILL);
            while (waitpid(pgid, &status, 0) < 0 && errno == EINTR) {
            }
        }
    }

    // The leader is gone; nothing it spawned may linger
    kill(-pgid, SIGKILL);
    return status;
}

void ProcessSupervisor::handleLine(const ToolInvocation& invocation, const std::string& line,
                                   OutputClassifier& classifier, std::string& output) {
    output += line;
    output += '\n';
    classifier.observe(line);

    if (invocation.line_callback) {
        invocation.line_callback(line);
    }

    if (invocation.echo || m_verbosity >= 1) {
        if (!invocation.filter || invocation.filter->shouldDisplay(line)) {
            std::cout << line << std::endl;
        }
    }
}

std::string ProcessSupervisor::decodeOutput(const std::string& raw) {
    static const char* hex_digits = "0123456789abcdef";
    std::string decoded;
    decoded.reserve(raw.size());

    auto is_continuation = [&raw](size_t index) {
        if (index >= raw.size()) {
            return false;
        }
        unsigned char byte = static_cast<unsigned char>(raw[index]);
        return (byte & 0xC0) == 0x80;
    };

    size_t i = 0;
    while (i < raw.size()) {
        unsigned char lead = static_cast<unsigned char>(raw[i]);
        size_t length = 0;
        if (lead < 0x80) {
            length = 1;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
        }

        bool valid = length > 0;
        for (size_t k = 1; valid && k < length; ++k) {
            valid = is_continuation(i + k);
        }
        if (valid && length >= 3) {
            unsigned char second = static_cast<unsigned char>(raw[i + 1]);
            // Reject overlong forms, UTF-16 surrogates and code points past U+10FFFF
            if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F) ||
                (lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F)) {
                valid = false;
            }
        }

        if (valid) {
            decoded.append(raw, i, length);
            i += length;
        } else {
            decoded += "\\x";
            decoded += hex_digits[lead >> 4];
            decoded += hex_digits[lead & 0x0F];
            ++i;
        }
    }
    return decoded;
}

} // namespace Packwright
