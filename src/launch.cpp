/*
 * Game process execution
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "launch.hpp"
#include "log.hpp"
#include "macros.hpp"
#include "util.hpp"

#include "fmt/format.h"

extern char **environ;

namespace launch {

/* Sent from the child to the parent over a close-on-exec pipe when exec never happens */
struct child_failure {
    char stage; /* 'd' = chdir, 'e' = exec */
    int error;
};

static std::vector<std::string> build_environment(const env_map &overrides) {
    std::vector<std::string> env;

    for (char **entry = environ; entry && *entry; entry++) {
        const char *eq = strchr(*entry, '=');
        std::string name(*entry, eq ? (size_t)(eq - *entry) : strlen(*entry));
        if (!overrides.contains(name))
            env.emplace_back(*entry);
    }

    for (const auto &[name, value] : overrides)
        env.push_back(fmt::format("{}={}", name, value));

    return env;
}

static std::vector<char *> to_pointer_array(const std::vector<std::string> &strings) {
    std::vector<char *> pointers;
    pointers.reserve(strings.size() + 1);
    for (const auto &s : strings)
        pointers.push_back(const_cast<char *>(s.c_str()));
    pointers.push_back(nullptr);
    return pointers;
}

[[noreturn]] static void child_fail(int fd, char stage) {
    child_failure failure = {stage, errno};
    ssize_t written = write(fd, &failure, sizeof(failure));
    (void)written;
    _exit(127);
}

RESULT execute_program(const launch_request &request, int *exit_code) {
    if (request.argv.empty())
        return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_INVALID_ARG);

    /* Everything the child needs is allocated before fork() */
    const std::vector<std::string> env = build_environment(request.env);
    std::vector<char *> argv = to_pointer_array(request.argv);
    std::vector<char *> envp = to_pointer_array(env);

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        return result_from_errno();

    autoclose_fd int read_fd = fds[0];
    autoclose_fd int write_fd = fds[1];

    fflush(stdout);
    fflush(stderr);

    pid_t child = fork();
    if (child < 0) {
        RESULT result = result_from_errno();
        LOG_ERROR("fork failed: %s", strerror(errno));
        return result;
    }

    if (child == 0) {
        if (request.cwd && chdir(request.cwd->c_str()) != 0)
            child_fail(write_fd, 'd');
        execvpe(argv[0], argv.data(), envp.data());
        child_fail(write_fd, 'e');
    }

    close(write_fd);
    write_fd = -1;

    child_failure failure = {};
    ssize_t n;
    do {
        n = read(read_fd, &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);

    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(child, &status, 0);
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) {
        RESULT result = result_from_errno();
        LOG_ERROR("waitpid failed: %s", strerror(errno));
        return result;
    }

    if (n == (ssize_t)sizeof(failure)) {
        if (failure.stage == 'd') {
            LOG_DEBUG("chdir(%s) failed in child: %s", request.cwd->c_str(), strerror(failure.error));
            return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_NOT_DIR);
        }
        LOG_DEBUG("exec(%s) failed in child: %s", argv[0], strerror(failure.error));
        return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_EXEC_FAILED);
    }

    if (WIFEXITED(status))
        *exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        *exit_code = 128 + WTERMSIG(status);
    else
        *exit_code = 1;

    LOG_DEBUG("%s exited with status %d", argv[0], *exit_code);
    return RESULT_OK;
}

std::string render_command(const launch_request &request) {
    std::string rendered;

    if (request.cwd)
        rendered = fmt::format("cd {} && ", shell_quote(*request.cwd));

    for (const auto &[name, value] : request.env)
        rendered += fmt::format("{}={} ", name, shell_quote(value));

    for (size_t i = 0; i < request.argv.size(); i++) {
        if (i > 0)
            rendered.push_back(' ');
        rendered += shell_quote(request.argv[i]);
    }

    return rendered;
}

RESULT run_game(const game_record &game, const executor &exec, launch_error *err) {
    if (!game.installed)
        return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_NOT_INSTALLED);

    if (!exec)
        return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_INVALID_ARG);

    launch_request request = {game.argv, game.environment, game.working_directory};
    int exit_code = 0;

    LOG_INFO("Launching %s: %s", game.id.c_str(), render_command(request).c_str());

    RESULT result = exec(request, &exit_code);
    if (FAILED(result)) {
        if (RESULT_CODE(result) == E_NOT_DIR && request.cwd)
            err->detail = *request.cwd;
        else
            err->detail = render_command(request);
        return result;
    }

    if (exit_code != 0) {
        err->detail = render_command(request);
        err->exit_code = exit_code;
        LOG_WARNING("%s exited with status %d", game.id.c_str(), exit_code);
        return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_COMMAND_FAILED);
    }

    return RESULT_OK;
}

}; // namespace launch
