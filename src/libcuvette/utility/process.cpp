/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <vector>

#include <limits.h>
#include <unistd.h>
#include <sys/wait.h>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include "libcuvette/Error.hpp"
#include "libcuvette/utility/environment.hpp"
#include "libcuvette/Logger.hpp"

/**
 * Utility functions for system operations
 */

namespace libcuvette {
namespace process {

static void readCStream(FILE* const in, std::iostream* const out) {
    char buffer[1024];
    while(!feof(in)) {
        if(fgets(buffer, sizeof(buffer), in)) {
            *out << buffer;
        }
        else if(!feof(in)) {
            CUVETTE_THROW_ERROR("Failed to read C stream: call to fgets() failed.");
        }
    }
}

/**
 * Forks, executes the given command line in the child and waits for it.
 * Returns the exit status of the child. A child that cannot exec the command
 * exits with status 127, like a shell does.
 */
int forkExecWait(const libcuvette::CLIArguments& args,
                 const boost::optional<std::function<void()>>& preExecChildActions,
                 const boost::optional<std::function<void(int)>>& postForkParentActions,
                 std::iostream* const childStdoutStream) {
    logMessage(boost::format("Forking and executing %s") % args.quotedString(), libcuvette::LogLevel::DEBUG);

    int pipefd[2];
    if(childStdoutStream) {
        if(pipe(pipefd) == -1) {
            auto message = boost::format("Failed to open pipe to execute subprocess %s: %s")
                % args.quotedString() % strerror(errno);
            CUVETTE_THROW_ERROR(message.str());
        }
    }

    // fork and execute
    auto pid = fork();
    if(pid == -1) {
        auto message = boost::format("Failed to fork to execute subprocess %s: %s")
            % args.quotedString() % strerror(errno);
        CUVETTE_THROW_ERROR(message.str());
    }

    bool isChild = pid == 0;
    if(isChild) {
        if(childStdoutStream) {
            // Redirect stdout to write to the pipe, then we don't need the pipe ends anymore
            dup2(pipefd[1], STDOUT_FILENO);
            close(pipefd[0]);
            close(pipefd[1]);
        }
        if(preExecChildActions) {
            (*preExecChildActions)();
        }
        execvp(args.argv()[0], args.argv());
        // only async-signal-safe calls from here on
        const char error[] = "Failed to execvp subprocess\n";
        auto ignored = write(STDERR_FILENO, error, sizeof(error)-1);
        (void)ignored;
        _exit(127);
    }
    else {
        if(postForkParentActions) {
            (*postForkParentActions)(pid);
        }
        if(childStdoutStream) {
            // Close the write end of the pipe, as it won't be used
            close(pipefd[1]);

            FILE *childStdoutPipe = fdopen(pipefd[0], "r");
            try {
                readCStream(childStdoutPipe, childStdoutStream);
            } catch(const libcuvette::Error& e) {
                fclose(childStdoutPipe);
                auto message = boost::format("Failed to read stdout from subprocess %s") % args.quotedString();
                CUVETTE_RETHROW_ERROR(e, message.str());
            }
            fclose(childStdoutPipe);
        }
        int status;
        do {
            if(waitpid(pid, &status, 0) == -1) {
                if(errno == EINTR) {
                    continue;
                }
                auto message = boost::format("Failed to waitpid subprocess %s: %s")
                    % args.quotedString() % strerror(errno);
                CUVETTE_THROW_ERROR(message.str());
            }
        } while(!WIFEXITED(status) && !WIFSIGNALED(status));

        if(!WIFEXITED(status)) {
            auto message = boost::format("Subprocess %s terminated abnormally")
                % args.quotedString();
            CUVETTE_THROW_ERROR(message.str());
        }

        logMessage( boost::format("%s (pid %d) exited with status %d") % args.quotedString() % pid % WEXITSTATUS(status),
                    libcuvette::LogLevel::DEBUG);

        return WEXITSTATUS(status);
    }
}

/**
 * Resolves an executable the way execvp() does: names containing a slash are
 * taken as they are, other names are looked up in the directories of PATH.
 */
boost::optional<boost::filesystem::path> findExecutable(const std::string& name) {
    if(name.empty()) {
        return {};
    }

    if(name.find('/') != std::string::npos) {
        if(access(name.c_str(), X_OK) == 0 && !boost::filesystem::is_directory(name)) {
            return boost::filesystem::path{name};
        }
        return {};
    }

    auto path = environment::getOptionalVariable("PATH");
    if(!path) {
        return {};
    }

    auto directories = std::vector<std::string>{};
    boost::split(directories, *path, boost::is_any_of(":"));
    for(const auto& directory : directories) {
        auto candidate = boost::filesystem::path{directory.empty() ? "." : directory} / name;
        if(access(candidate.c_str(), X_OK) == 0 && !boost::filesystem::is_directory(candidate)) {
            logMessage(boost::format("Found executable %s at %s") % name % candidate, libcuvette::LogLevel::DEBUG);
            return candidate;
        }
    }

    return {};
}

std::string getHostname() {
    char hostname[HOST_NAME_MAX];
    if(gethostname(hostname, HOST_NAME_MAX) != 0) {
        auto message = boost::format("failed to retrieve hostname (%s)") % strerror(errno);
        CUVETTE_THROW_ERROR(message.str());
    }
    hostname[HOST_NAME_MAX-1] = '\0';
    return hostname;
}

}}
