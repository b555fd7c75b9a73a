/*
 * Command line verbs
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "config.h"

#include <cstdlib>

#include "commands.hpp"
#include "launchconfig.hpp"
#include "macros.hpp"
#include "stats.hpp"
#include "util.hpp"

#include "fmt/format.h"
#include "fmt/printf.h"

#define USAGE "USAGE: " PROG_NAME " [COMMAND]"

/* Sorted by name, `help` prints them in this order */
static constexpr command commands[] = {
    {"edit", nullptr, command_edit, "Edit the config file", false},
    {"help", nullptr, command_help, "Explain the commands", false},
    {"list", "TAGS...", command_list, "List games in the format \"game_id - name\"", true},
    {"play", "GAME_ID", command_play, "Play a game, specified by its game ID", true},
    {"play-random", "TAGS...", command_play_random, "Play a random game", true},
    {"stats", "GAME_ID...", command_stats, "Show game statistics", true},
    {"tags", nullptr, command_tags, "List all tags", true},
    {"version", nullptr, command_version, "Print the version", false},
};

const command *find_command(const char *name) {
    for (size_t i = 0; i < ARRAY_SIZE(commands); i++) {
        if (STRING_EQUALS(commands[i].name, name))
            return &commands[i];
    }
    return nullptr;
}

void print_usage(FILE *out) { fmt::fprintf(out, "%s\n", USAGE); }

static std::string join_args(const std::vector<std::string> &args) {
    std::string joined;
    for (const auto &arg : args)
        joined += joined.empty() ? arg : " " + arg;
    return joined;
}

std::string describe_command_error(RESULT result, const command_error &err) {
    if (RESULT_CATEGORY(result) == CAT_STATS) {
        if (err.detail.empty())
            return fmt::format("Could not update game stats: {}", result_to_string(result));
        return fmt::format("Could not update game stats ({}): {}", err.detail, result_to_string(result));
    }

    switch (RESULT_CODE(result)) {
    case E_NO_GAME_ID:
        return "A game ID is required";
    case E_NO_SUCH_GAME:
        return fmt::format("No such game: {}", err.detail);
    case E_NOT_DIR:
        return fmt::format("Could not change directory to: {}", err.detail);
    case E_EXEC_FAILED:
        return fmt::format("Could not execute game: {}", err.detail);
    case E_COMMAND_FAILED:
        return fmt::format("Command failed (exit status {}): {}", err.exit_code, err.detail);
    case E_NOT_INSTALLED:
        return fmt::format("Game is not installed: {}", err.detail);
    case E_NO_EDITOR:
        return "No default editor in $EDITOR";
    case E_NOT_FOUND:
        if (err.detail.empty())
            return "No installed games";
        return fmt::format("No installed game matches: {}", err.detail);
    default:
        if (!err.detail.empty())
            return fmt::format("{}: {}", result_to_string(result), err.detail);
        return result_to_string(result);
    }
}

RESULT command_help(const command_context &ctx, const std::vector<std::string> &, command_error *) {
    fmt::fprintf(ctx.out, "%s\n\nCommands:\n", USAGE);

    for (size_t i = 0; i < ARRAY_SIZE(commands); i++) {
        const command &c = commands[i];
        if (c.args)
            fmt::fprintf(ctx.out, "\t%s [%s] - %s\n", c.name, c.args, c.desc);
        else
            fmt::fprintf(ctx.out, "\t%s - %s\n", c.name, c.desc);
    }

    fmt::fprintf(ctx.out, "\nGames are configured in %s, see %s for the format.\n",
                 ctx.config_path.empty() ? CONFIG_FILE_NAME : ctx.config_path, PACKAGE_URL);

    return RESULT_OK;
}

RESULT command_version(const command_context &ctx, const std::vector<std::string> &, command_error *) {
    fmt::fprintf(ctx.out, "%s\n", VERSION);
    return RESULT_OK;
}

RESULT command_list(const command_context &ctx, const std::vector<std::string> &args, command_error *) {
    for (const auto &line : catalog::list_games(*ctx.catalog, args))
        fmt::fprintf(ctx.out, "%s\n", line);
    return RESULT_OK;
}

RESULT command_tags(const command_context &ctx, const std::vector<std::string> &, command_error *) {
    for (const auto &tag : catalog::all_tags(*ctx.catalog))
        fmt::fprintf(ctx.out, "%s\n", tag);
    return RESULT_OK;
}

static RESULT play_and_report(const command_context &ctx, const game_record &game, command_error *err) {
    session_report report;

    RESULT result = play_game(game, ctx.exec, ctx.ledger_path.c_str(), &report, ctx.clock);
    if (FAILED(result) && RESULT_CATEGORY(result) != CAT_STATS) {
        err->detail = RESULT_CODE(result) == E_NOT_INSTALLED ? game.id : report.launch.detail;
        err->exit_code = report.launch.exit_code;
        return result;
    }

    fmt::fprintf(ctx.out, "Game: %s (%s)\n", game.name, game.id);
    fmt::fprintf(ctx.out, "%s\n", format_session(report));

    if (FAILED(result))
        err->detail = ctx.ledger_path;

    return result;
}

RESULT command_play(const command_context &ctx, const std::vector<std::string> &args, command_error *err) {
    if (args.empty())
        return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_NO_GAME_ID);

    const game_record *game = catalog::find(*ctx.catalog, args[0]);
    if (!game) {
        err->detail = args[0];
        return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_NO_SUCH_GAME);
    }

    return play_and_report(ctx, *game, err);
}

RESULT command_play_random(const command_context &ctx, const std::vector<std::string> &args, command_error *err) {
    std::mt19937 fallback_rng{std::random_device{}()};
    const game_record *game = nullptr;

    RESULT result = catalog::pick_random(*ctx.catalog, args, ctx.rng ? *ctx.rng : fallback_rng, &game);
    if (FAILED(result)) {
        err->detail = join_args(args);
        return result;
    }

    return play_and_report(ctx, *game, err);
}

RESULT command_edit(const command_context &ctx, const std::vector<std::string> &, command_error *err) {
    const char *editor = getenv("EDITOR");
    std::vector<std::string> argv;

    if (!editor || !editor[0] || FAILED(split_shell_words(editor, &argv)) || argv.empty())
        return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_NO_EDITOR);

    argv.push_back(ctx.config_path);
    launch::launch_request request = {std::move(argv), {}, std::nullopt};
    int exit_code = 0;

    RESULT result = ctx.exec(request, &exit_code);
    if (FAILED(result)) {
        err->detail = launch::render_command(request);
        return result;
    }

    if (exit_code != 0) {
        err->detail = launch::render_command(request);
        err->exit_code = exit_code;
        return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_COMMAND_FAILED);
    }

    return RESULT_OK;
}

RESULT command_stats(const command_context &ctx, const std::vector<std::string> &args, command_error *err) {
    uint64_t total_seconds = 0;
    size_t count = 0;

    if (args.empty())
        return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_NO_GAME_ID);

    for (const auto &game_id : args) {
        const game_record *game = catalog::find(*ctx.catalog, game_id);
        if (!game) {
            err->detail = game_id;
            return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_NO_SUCH_GAME);
        }

        stats::game_stats game_stats;
        RESULT result = stats::find_stats(ctx.ledger_path.c_str(), game->id, &game_stats);
        if (FAILED(result)) {
            if (RESULT_CODE(result) != E_NOT_FOUND) {
                err->detail = ctx.ledger_path;
                return result;
            }
            if (args.size() == 1)
                fmt::fprintf(ctx.out, "No stats found\n");
            continue;
        }

        count++;
        total_seconds += game_stats.play_time_seconds;
        if (count > 1)
            fmt::fprintf(ctx.out, "\n");
        fmt::fprintf(ctx.out, "%s (%s) Statistics\n", game->name, game->id);
        fmt::fprintf(ctx.out, "Play Time: %s\n", stats::format_play_time(game_stats.play_time_seconds));
        fmt::fprintf(ctx.out, "Last Played: %s\n", stats::format_timestamp(game_stats.last_played));
    }

    if (count > 1)
        fmt::fprintf(ctx.out, "\nTotal Play Time: %s\n", stats::format_play_time(total_seconds));

    return RESULT_OK;
}
