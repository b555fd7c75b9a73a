/*
 * Per-game command resolution
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <iterator>
#include <utility>

#include "builder.hpp"
#include "log.hpp"
#include "util.hpp"

#include "fmt/format.h"

std::string describe_compile_error(const compile_error &err) {
    const char *id = err.game_id.c_str();

    switch (RESULT_CODE(err.result)) {
    case E_MISSING_NAME:
        return fmt::format("Game missing name: {}", id);
    case E_MISSING_COMMAND:
        return fmt::format("Game missing cmd: {}", id);
    case E_NO_SUCH_DIR_PREFIX:
        return fmt::format("Game {} has nonexistent directory prefix: {}", id, err.detail);
    case E_UNRECOGNIZED_OPTION:
        return fmt::format("Unrecognized option: {} (in game {})", err.detail, id);
    case E_CONFLICTING_COMMAND:
        return fmt::format("Game {} sets more than one command option: {}", id, err.detail);
    case E_GAME_NOT_TABLE:
        return fmt::format("The 'games.{}' key must correspond to a table", id);
    case E_MISSING_GAMES:
        return "A 'games' table is required";
    case E_PARSE_ERROR:
        if (!err.game_id.empty())
            return fmt::format("Game {} has an unterminated quote or escape in: {}", id, err.detail);
        return err.detail;
    default:
        if (!err.detail.empty())
            return fmt::format("{}: {}", result_to_string(err.result), err.detail);
        return result_to_string(err.result);
    }
}

void set_command(game_draft *draft, const char *source, std::vector<std::string> command) {
    draft->command = std::move(command);
    draft->command_sources.emplace_back(source);
}

bool is_wine_command(const std::vector<std::string> &command) {
    return !command.empty() && command[0] == WINE_COMMAND;
}

static RESULT fail(compile_error *err, int code, const std::string &game_id, std::string detail) {
    err->result = MAKE_RESULT(SEV_ERROR, CAT_CONFIG, code);
    err->game_id = game_id;
    err->detail = std::move(detail);
    return err->result;
}

/* Resolve dir_prefix and dir through the [directories] aliases */
static RESULT resolve_directory(const game_draft &draft, const directory_table &directories,
                                std::optional<std::string> *working_directory, compile_error *err) {
    std::string prefix;

    if (!draft.dir_prefix.empty()) {
        auto it = directories.find(draft.dir_prefix);
        if (it == directories.end())
            return fail(err, E_NO_SUCH_DIR_PREFIX, draft.id, draft.dir_prefix);
        prefix = it->second;
    }

    /* "dir" may name an alias directly */
    std::string dir = draft.dir;
    if (!dir.empty()) {
        auto it = directories.find(dir);
        if (it != directories.end())
            dir = it->second;
    }

    std::string joined = join_path(prefix, dir);
    if (!joined.empty())
        *working_directory = std::move(joined);
    else
        working_directory->reset();

    return RESULT_OK;
}

static std::vector<std::string> gamescope_command(const display_settings &settings, std::optional<int64_t> fps_limit,
                                                  bool use_mangohud, std::vector<std::string> inner) {
    std::vector<std::string> argv = {GAMESCOPE_COMMAND,
                                     "-W",
                                     std::to_string(settings.width),
                                     "-H",
                                     std::to_string(settings.height),
                                     "-f",
                                     "--force-grab-cursor"};

    if (fps_limit) {
        argv.emplace_back("-r");
        argv.push_back(std::to_string(*fps_limit));
    }
    if (use_mangohud)
        argv.emplace_back("--mangoapp");

    argv.emplace_back("--");
    argv.insert(argv.end(), std::make_move_iterator(inner.begin()), std::make_move_iterator(inner.end()));

    return argv;
}

RESULT finalize_game(game_draft draft, const directory_table &directories, const display_settings &settings,
                     game_record *game, compile_error *err) {
    if (!draft.name || draft.name->empty())
        return fail(err, E_MISSING_NAME, draft.id, "name");

    if (draft.command_sources.size() > 1) {
        std::string keys;
        for (const auto &source : draft.command_sources)
            keys += keys.empty() ? source : ", " + source;
        return fail(err, E_CONFLICTING_COMMAND, draft.id, keys);
    }

    if (draft.command.empty())
        return fail(err, E_MISSING_COMMAND, draft.id, "cmd");

    /* Unset means: only for Wine games */
    const bool use_mangohud = draft.use_mangohud.value_or(is_wine_command(draft.command));
    /* The compositor is a catalog-wide choice, a game's own use_gamescope key never toggles it */
    const bool use_gamescope = settings.use_gamescope;

    game_record result;
    RETURN_IF_FAILED(resolve_directory(draft, directories, &result.working_directory, err));

    if (use_gamescope) {
        result.argv = gamescope_command(settings, draft.fps_limit, use_mangohud, std::move(draft.command));
    } else if (use_mangohud) {
        result.argv.reserve(draft.command.size() + 1);
        result.argv.emplace_back(MANGOHUD_COMMAND);
        result.argv.insert(result.argv.end(), std::make_move_iterator(draft.command.begin()),
                           std::make_move_iterator(draft.command.end()));
    } else {
        result.argv = std::move(draft.command);
    }

    result.environment = std::move(draft.env);
    if (use_mangohud && draft.fps_limit)
        result.environment[MANGOHUD_CONFIG_ENV] = fmt::format("fps_limit={}", *draft.fps_limit);
    if (draft.use_vk == false)
        result.environment[WINEDLLOVERRIDES_ENV] = WINED3D_OVERRIDES;

    result.id = std::move(draft.id);
    result.name = std::move(*draft.name);
    result.tags = std::move(draft.tags);
    result.installed = draft.installed;

    LOG_DEBUG("Resolved game %s: %zu argv entries, %zu environment overrides%s", result.id.c_str(),
              result.argv.size(), result.environment.size(), use_gamescope ? " (gamescope)" : "");

    *game = std::move(result);
    return RESULT_OK;
}
