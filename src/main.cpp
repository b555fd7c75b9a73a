/*
 * gamelaunch: launch games from a TOML catalog and track play time
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "config.h"

#include <cstdio>
#include <random>

#include "commands.hpp"
#include "launchconfig.hpp"
#include "log.hpp"
#include "options.hpp"
#include "util.hpp"

#include "fmt/format.h"
#include "fmt/printf.h"

/* Errors go to the terminal, or to a notification when we were started from a menu entry */
static void report_error(const std::string &message) {
    fmt::fprintf(stderr, "Error: %s\n", message);
    if (!log_get_terminal_output())
        LOG_SYSTEM("%s", message.c_str());
    else
        LOG_DEBUG("%s", message.c_str());
}

static RESULT load_catalog(const std::string &config_path, game_catalog *catalog) {
    std::string document;

    RESULT result = read_file(config_path.c_str(), &document);
    if (FAILED(result)) {
        if (RESULT_CODE(result) == E_FILE_NOT_FOUND)
            report_error(fmt::format("No " CONFIG_FILE_NAME " config file found (expected at {})", config_path));
        else
            report_error(fmt::format("Could not read {}: {}", config_path, result_to_string(result)));
        return result;
    }

    compile_error err;
    result = compile_catalog(document, catalog, &err);
    if (FAILED(result))
        report_error(fmt::format("{}: {}", config_path, describe_compile_error(err)));

    return result;
}

int main(int argc, char *argv[]) {
    if (FAILED(config::setup_config_dir())) {
        fmt::fprintf(stderr, "The configuration directory is unusable\n");
        return 1;
    }

    if (FAILED(config::setup_data_dir())) {
        fmt::fprintf(stderr, "The data directory is unusable\n");
        return 1;
    }

    RESULT result = log_init();
    if (FAILED(result) && (RESULT_CODE(result) != E_CANCELED))
        fmt::fprintf(stderr, "Warning: Failed to initialize logging to file: %s\n", result_to_string(result));

    LOG_DEBUG(PROG_NAME " directories initialized - config_dir: %s, data_dir: %s", config::config_dir,
              config::data_dir);

    const command *cmd = argc > 1 ? find_command(argv[1]) : nullptr;
    if (!cmd) {
        if (argc > 1)
            fmt::fprintf(stderr, "Error: Unknown command: %s\n", argv[1]);
        print_usage(stderr);
        log_cleanup();
        return 1;
    }

    std::vector<std::string> args(argv + 2, argv + argc);
    std::mt19937 rng{std::random_device{}()};

    command_context ctx = {};
    ctx.exec = launch::execute_program;
    ctx.config_path = config::config_file_path();
    ctx.ledger_path = config::stats_file_path();
    ctx.rng = &rng;
    ctx.out = stdout;

    game_catalog catalog;
    if (cmd->needs_catalog) {
        if (FAILED(load_catalog(ctx.config_path, &catalog))) {
            log_cleanup();
            return 1;
        }
        ctx.catalog = &catalog;
    }

    LOG_DEBUG("Running command %s with %zu argument(s)", cmd->name, args.size());

    command_error err;
    result = cmd->exec(ctx, args, &err);
    if (FAILED(result)) {
        report_error(describe_command_error(result, err));
        if (RESULT_CODE(result) == E_NO_GAME_ID)
            print_usage(stderr);
    }

    log_cleanup();
    return FAILED(result) ? 1 : 0;
}
