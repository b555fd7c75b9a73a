/*
 * Command line verbs
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <cstdio>
#include <random>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "launch.hpp"
#include "result.hpp"
#include "session.hpp"

struct command_context {
    const game_catalog *catalog; /* nullptr for commands that don't need one */
    launch::executor exec;
    session_clock clock;
    std::string config_path;
    std::string ledger_path;
    std::mt19937 *rng;
    FILE *out;
};

/* Context for a failed command */
struct command_error {
    std::string detail; /* game id, directory, rendered command or selectors */
    int exit_code = 0;
};

typedef RESULT (*command_handler)(const command_context &ctx, const std::vector<std::string> &args,
                                  command_error *err);

struct command {
    const char *name;
    const char *args; /* usage hint, nullptr if none */
    command_handler exec;
    const char *desc;
    bool needs_catalog;
};

/* nullptr for an unknown verb */
const command *find_command(const char *name);

void print_usage(FILE *out);

/* One line, user facing */
std::string describe_command_error(RESULT result, const command_error &err);

RESULT command_help(const command_context &ctx, const std::vector<std::string> &args, command_error *err);
RESULT command_list(const command_context &ctx, const std::vector<std::string> &args, command_error *err);
RESULT command_tags(const command_context &ctx, const std::vector<std::string> &args, command_error *err);
RESULT command_play(const command_context &ctx, const std::vector<std::string> &args, command_error *err);
RESULT command_play_random(const command_context &ctx, const std::vector<std::string> &args, command_error *err);
RESULT command_edit(const command_context &ctx, const std::vector<std::string> &args, command_error *err);
RESULT command_stats(const command_context &ctx, const std::vector<std::string> &args, command_error *err);
RESULT command_version(const command_context &ctx, const std::vector<std::string> &args, command_error *err);
