/*
 * Game process execution
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "game.hpp"
#include "result.hpp"

namespace launch {

struct launch_request {
    std::vector<std::string> argv;
    env_map env;                    /* merged over the inherited environment */
    std::optional<std::string> cwd; /* entered in the child before exec */
};

/* Context for a failed launch */
struct launch_error {
    std::string detail; /* directory or rendered command line */
    int exit_code = 0;
};

/*
 * Runs a request to completion. Returns RESULT_OK with the child's exit status in `exit_code`
 * (128 + signal number for a killed child), E_NOT_DIR (CAT_LAUNCH) if the working directory can't be
 * entered, E_EXEC_FAILED (CAT_LAUNCH) if the program can't be run.
 */
typedef std::function<RESULT(const launch_request &request, int *exit_code)> executor;

/* The fork/exec executor */
RESULT execute_program(const launch_request &request, int *exit_code);

/* A shell-quoted rendering of the command, with its environment overrides in front */
std::string render_command(const launch_request &request);

/* Launch a game and wait for it. Any non-zero exit status is a failure (E_COMMAND_FAILED). */
RESULT run_game(const game_record &game, const executor &exec, launch_error *err);

}; // namespace launch
