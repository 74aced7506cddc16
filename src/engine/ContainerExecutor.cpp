/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ContainerExecutor.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <boost/format.hpp>

#include "libcuvette/Utility.hpp"
#include "engine/Errors.hpp"
#include "engine/Utility.hpp"


namespace cuvette {
namespace engine {

const char* const ContainerExecutor::scriptFilename = "main.py";

namespace {

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd{fd} {}
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    ~FileDescriptor() { reset(); }

    int get() const { return fd; }
    bool isOpen() const { return fd != -1; }
    void reset(int newFd = -1) {
        if(fd != -1) {
            ::close(fd);
        }
        fd = newFd;
    }

private:
    int fd = -1;
};

struct Pipe {
    FileDescriptor readEnd;
    FileDescriptor writeEnd;
};

void openPipe(Pipe& p, const std::string& purpose) {
    int fds[2];
    if(pipe2(fds, O_CLOEXEC) == -1) {
        auto message = boost::format("Failed to open %s pipe for the container runtime: %s") % purpose % strerror(errno);
        CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
    }
    p.readEnd.reset(fds[0]);
    p.writeEnd.reset(fds[1]);
}

int decodeWaitStatus(int status) {
    if(WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    else if(WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Returns the wait status, or nothing when the child is still running
boost::optional<int> tryWait(pid_t pid) {
    int status;
    while(true) {
        auto ret = waitpid(pid, &status, WNOHANG);
        if(ret == pid) {
            return status;
        }
        else if(ret == 0) {
            return {};
        }
        else if(errno != EINTR) {
            auto message = boost::format("Failed to waitpid container runtime process %d: %s") % pid % strerror(errno);
            CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
        }
    }
}

int waitBlocking(pid_t pid) {
    int status;
    while(waitpid(pid, &status, 0) == -1) {
        if(errno != EINTR) {
            auto message = boost::format("Failed to waitpid container runtime process %d: %s") % pid % strerror(errno);
            CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
        }
    }
    return status;
}

// Polls for the exit of the child until the deadline, returns its wait status if it exited
boost::optional<int> waitUntil(pid_t pid, std::chrono::steady_clock::time_point deadline) {
    while(true) {
        auto status = tryWait(pid);
        if(status || std::chrono::steady_clock::now() >= deadline) {
            return status;
        }
        poll(nullptr, 0, 10);
    }
}

void redirectStdoutAndStderrToDevNull() {
    auto fd = open("/dev/null", O_WRONLY);
    if(fd != -1) {
        dup2(fd, STDOUT_FILENO);
        dup2(fd, STDERR_FILENO);
        close(fd);
    }
}

}

ContainerExecutor::ContainerExecutor(std::shared_ptr<const common::Config> config)
    : config{std::move(config)}
{}

std::string ContainerExecutor::makeContainerName() {
    return "cuvette-" + libcuvette::string::generateRandom(16);
}

// outside of the mounted roots: only the runtime client writes it
boost::filesystem::path ContainerExecutor::getContainerIdFile(const StagingContext& context) {
    return context.getRunRoot() / "container.id";
}

/**
 * Verifies that the runtime client can be executed and, unless disabled, that
 * the guest image is present locally. Nothing is spawned for the guest before
 * this check succeeds.
 */
boost::filesystem::path ContainerExecutor::checkAvailability() const {
    auto runtime = std::string{ config->json["runtimePath"].GetString() };
    auto image = std::string{ config->json["image"].GetString() };

    auto runtimePath = libcuvette::process::findExecutable(runtime);
    if(!runtimePath) {
        auto message = boost::format("Container runtime '%s' is not available: executable not found") % runtime;
        CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
    }

    if(config->getFlag("checkImageAvailability", true)) {
        auto args = libcuvette::CLIArguments{runtimePath->string(), "image", "inspect", image};
        int status;
        try {
            status = libcuvette::process::forkExecWait(args, std::function<void()>{redirectStdoutAndStderrToDevNull});
        }
        catch(const libcuvette::Error& e) {
            auto message = boost::format("Failed to check availability of container image '%s': %s") % image % e.what();
            CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
        }
        if(status != 0) {
            auto message = boost::format("Container image '%s' is not available (%s exited with status %d)")
                % image % args.quotedString() % status;
            CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
        }
    }

    utility::logMessage(boost::format("Container runtime %s and image %s are available") % *runtimePath % image,
                        libcuvette::LogLevel::DEBUG);
    return *runtimePath;
}

libcuvette::CLIArguments ContainerExecutor::makeRunArguments(const std::string& containerName,
                                                             const StagingContext& context,
                                                             const ResourceLimits& limits,
                                                             const GuestEnvironment& environment,
                                                             const GuestPaths& guestPaths) const {
    auto hostScript = context.getScriptRoot() / scriptFilename;
    auto guestScript = guestPaths.scriptDir / scriptFilename;
    auto memory = std::to_string(limits.memoryBytes);

    auto args = libcuvette::CLIArguments{
        config->json["runtimePath"].GetString(), "run",
        "--rm",
        "--name", containerName,
        "--cidfile", getContainerIdFile(context).string(),
        "--network", "none",
        "--memory", memory,
        "--memory-swap", memory,
        "--cpus", (boost::format("%g") % limits.cpus).str(),
        "--pids-limit", std::to_string(limits.pidsLimit),
        "--read-only",
        "--tmpfs", "/tmp",
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges"
    };

    if(config->getFlag("runAsInvokingUser", true)) {
        args += libcuvette::CLIArguments{"--user", (boost::format("%d:%d") % getuid() % getgid()).str()};
    }

    args += libcuvette::CLIArguments{
        "-v", hostScript.string() + ":" + guestScript.string() + ":ro",
        "-v", context.getInputRoot().string() + ":" + guestPaths.inputDir.string() + ":ro",
        "-v", context.getOutputRoot().string() + ":" + guestPaths.outputDir.string() + ":rw",
        "-w", guestPaths.outputDir.string()
    };

    for(const auto& variable : environment) {
        args += libcuvette::CLIArguments{"-e", variable.first + "=" + variable.second};
    }

    args += libcuvette::CLIArguments{
        config->json["image"].GetString(),
        config->json["interpreter"].GetString(),
        guestScript.string()
    };

    return args;
}

/**
 * Spawns the runtime client and captures its output until it exits or the
 * deadline expires.
 *
 * Exec failures of the client are reported by the child through a close-on-exec
 * pipe: reading EOF from it means that the exec succeeded.
 * On timeout the process group of the client receives SIGTERM, then SIGKILL after
 * the grace period, and the container is killed through the runtime because the
 * client dying does not stop it.
 */
ExecutionOutcome ContainerExecutor::run(const libcuvette::CLIArguments& runArguments,
                                        const std::string& containerName,
                                        const boost::filesystem::path& containerIdFile,
                                        const ResourceLimits& limits,
                                        RunLogger& runLogger) const {
    utility::logMessage(boost::format("Executing container %s") % containerName, libcuvette::LogLevel::INFO);
    runLogger.log(RunLogger::Stage::EXECUTION, boost::format("Invoking %s") % runArguments.quotedString());

    Pipe stdoutPipe;
    Pipe stderrPipe;
    Pipe errorPipe;
    openPipe(stdoutPipe, "stdout");
    openPipe(stderrPipe, "stderr");
    openPipe(errorPipe, "exec error");

    auto start = std::chrono::steady_clock::now();
    auto pid = fork();
    if(pid == -1) {
        auto message = boost::format("Failed to fork to execute container runtime: %s") % strerror(errno);
        CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
    }

    if(pid == 0) {
        // only async-signal-safe calls from here on
        setpgid(0, 0);
        prctl(PR_SET_PDEATHSIG, SIGKILL);
        auto devNull = open("/dev/null", O_RDONLY);
        if(devNull != -1) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        dup2(stdoutPipe.writeEnd.get(), STDOUT_FILENO);
        dup2(stderrPipe.writeEnd.get(), STDERR_FILENO);
        execvp(runArguments.argv()[0], runArguments.argv());
        int error = errno;
        auto ignored = write(errorPipe.writeEnd.get(), &error, sizeof(error));
        (void)ignored;
        _exit(127);
    }

    // both parent and child set the process group, whichever runs first wins the race with kill()
    setpgid(pid, pid);
    stdoutPipe.writeEnd.reset();
    stderrPipe.writeEnd.reset();
    errorPipe.writeEnd.reset();

    int execError = 0;
    ssize_t bytesRead;
    do {
        bytesRead = read(errorPipe.readEnd.get(), &execError, sizeof(execError));
    } while(bytesRead == -1 && errno == EINTR);
    if(bytesRead > 0) {
        waitBlocking(pid);
        auto message = boost::format("Failed to execute container runtime %s: %s")
            % runArguments.argv()[0] % strerror(execError);
        CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
    }

    auto outcome = ExecutionOutcome{};
    outcome.exitCode = -1;
    outcome.truncated = false;
    std::size_t capturedBytes = 0;
    bool isStdoutTruncated = false;
    bool isStderrTruncated = false;

    auto capture = [&](const char* data, std::size_t size, std::string& streamText, const char* streamName) {
        auto chunk = std::string(data, size);
        runLogger.log(RunLogger::Stage::EXECUTION, boost::format("[%s] %s") % streamName % chunk);
        auto keep = capturedBytes >= limits.maxOutputBytes
            ? std::size_t{0}
            : std::min(size, limits.maxOutputBytes - capturedBytes);
        if(keep < size) {
            outcome.truncated = true;
            if(&streamText == &outcome.stdoutText) {
                isStdoutTruncated = true;
            }
            else {
                isStderrTruncated = true;
            }
        }
        streamText.append(data, keep);
        outcome.combinedText.append(data, keep);
        capturedBytes += keep;
    };

    auto deadline = start + limits.timeout;
    bool isTimedOut = false;
    char buffer[65536];

    while(stdoutPipe.readEnd.isOpen() || stderrPipe.readEnd.isOpen()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if(remaining.count() <= 0) {
            isTimedOut = true;
            break;
        }

        auto fds = std::vector<pollfd>{};
        if(stdoutPipe.readEnd.isOpen()) {
            fds.push_back(pollfd{stdoutPipe.readEnd.get(), POLLIN, 0});
        }
        if(stderrPipe.readEnd.isOpen()) {
            fds.push_back(pollfd{stderrPipe.readEnd.get(), POLLIN, 0});
        }

        auto ready = poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
        if(ready == -1) {
            if(errno == EINTR) {
                continue;
            }
            kill(-pid, SIGKILL);
            waitBlocking(pid);
            auto message = boost::format("Failed to poll output of container runtime: %s") % strerror(errno);
            CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
        }

        for(const auto& fd : fds) {
            if(fd.revents == 0) {
                continue;
            }
            bool isStdout = fd.fd == stdoutPipe.readEnd.get();
            auto& source = isStdout ? stdoutPipe.readEnd : stderrPipe.readEnd;
            auto count = read(fd.fd, buffer, sizeof(buffer));
            if(count > 0) {
                capture(buffer, static_cast<std::size_t>(count),
                        isStdout ? outcome.stdoutText : outcome.stderrText,
                        isStdout ? "stdout" : "stderr");
            }
            else if(count == 0 || errno != EINTR) {
                source.reset();
            }
        }
    }

    // the client may close its streams before exiting
    auto status = boost::optional<int>{};
    if(!isTimedOut) {
        status = waitUntil(pid, deadline);
        isTimedOut = !status;
    }

    if(isTimedOut) {
        utility::logMessage(boost::format("Container %s exceeded timeout of %d seconds")
                                % containerName % limits.timeout.count(),
                            libcuvette::LogLevel::INFO);
        runLogger.log(RunLogger::Stage::EXECUTION, boost::format("Timeout of %d seconds expired, killing %s")
                                                    % limits.timeout.count() % containerName);
        if(limits.killGracePeriod.count() > 0) {
            kill(-pid, SIGTERM);
            waitUntil(pid, std::chrono::steady_clock::now() + limits.killGracePeriod);
        }
        kill(-pid, SIGKILL);
        waitBlocking(pid);
        killContainer(containerName);

        auto message = boost::format("Execution timed out after %d seconds") % limits.timeout.count();
        CUVETTE_THROW_TYPED_ERROR(TimeoutError, message.str(), outcome.stdoutText, outcome.stderrText, limits.timeout);
    }

    // the notice goes to each stream that lost output
    if(outcome.truncated) {
        auto notice = (boost::format("\n[output truncated: exceeded %d bytes]\n") % limits.maxOutputBytes).str();
        if(isStdoutTruncated) {
            outcome.stdoutText += notice;
        }
        if(isStderrTruncated) {
            outcome.stderrText += notice;
        }
        outcome.combinedText += notice;
    }

    outcome.exitCode = decodeWaitStatus(*status);
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    runLogger.log(RunLogger::Stage::EXECUTION, boost::format("Container runtime exited with code %d after %.3f seconds")
                                                % outcome.exitCode % elapsed);

    if(outcome.exitCode == 0) {
        utility::logMessage(boost::format("Successfully executed container %s") % containerName, libcuvette::LogLevel::INFO);
        return outcome;
    }

    if(isRuntimeFailure(outcome, containerIdFile)) {
        auto message = boost::format("Container runtime failed to start the container (exit code %d): %s")
            % outcome.exitCode % outcome.stderrText;
        CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
    }

    auto message = boost::format("Execution failed with exit code %d\nstderr:\n%s\nstdout:\n%s")
        % outcome.exitCode % outcome.stderrText % outcome.stdoutText;
    CUVETTE_THROW_TYPED_ERROR(GuestExecutionError, message.str(), outcome.stdoutText, outcome.stderrText, outcome.exitCode);
}

void ContainerExecutor::killContainer(const std::string& containerName) const {
    auto args = libcuvette::CLIArguments{config->json["runtimePath"].GetString(), "kill", containerName};
    try {
        auto status = libcuvette::process::forkExecWait(args, std::function<void()>{redirectStdoutAndStderrToDevNull});
        if(status != 0) {
            utility::logMessage(boost::format("%s exited with status %d, container may already be gone") % args.quotedString() % status,
                                libcuvette::LogLevel::DEBUG);
        }
    }
    catch(const libcuvette::Error& e) {
        utility::logMessage(boost::format("Failed to kill container %s: %s") % containerName % e.what(),
                            libcuvette::LogLevel::WARN);
    }
}

/**
 * The runtime client passes the exit status of the container through, so a setup
 * exit code alone is ambiguous: the guest may exit with the same code. The exit is
 * a runtime failure only if the container was never created (the client writes the
 * container id file on creation) or the client reported an error of its own.
 */
bool ContainerExecutor::isRuntimeFailure(const ExecutionOutcome& outcome,
                                         const boost::filesystem::path& containerIdFile) const {
    auto codes = config->getRuntimeSetupExitCodes();
    if(std::find(codes.cbegin(), codes.cend(), outcome.exitCode) == codes.cend()) {
        return false;
    }

    boost::system::error_code ec;
    auto isCreated = boost::filesystem::is_regular_file(containerIdFile, ec)
                     && boost::filesystem::file_size(containerIdFile, ec) > 0
                     && !ec;
    if(!isCreated) {
        return true;
    }

    for(const auto& prefix : config->getStringArray("runtimeErrorPrefixes")) {
        if(outcome.stderrText.compare(0, prefix.size(), prefix) == 0
           || outcome.stderrText.find("\n" + prefix) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}
}
