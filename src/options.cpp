/*
 * Game option compiler: games.toml -> game records
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <limits>

#include "log.hpp"
#include "macros.hpp"
#include "options.hpp"
#include "util.hpp"

#include "fmt/format.h"

#define SCUMMVM_COMMAND "scummvm"
#define DOSBOX_COMMAND "dosbox"

static constexpr struct {
    const char *key;
    option opt;
} option_table[] = {
    {"cmd", option::cmd},
    {"dir", option::dir},
    {"dir_prefix", option::dir_prefix},
    {"dosbox_config", option::dosbox_config},
    {"env", option::env},
    {"fps_limit", option::fps_limit},
    {"installed", option::installed},
    {"name", option::name},
    {"scummvm_id", option::scummvm_id},
    {"tags", option::tags},
    {"use_gamescope", option::use_gamescope},
    {"use_mangohud", option::use_mangohud},
    {"use_vk", option::use_vk},
    {"wine_exe", option::wine_exe},
};

std::optional<option> lookup_option(std::string_view key) {
    for (size_t i = 0; i < ARRAY_SIZE(option_table); i++) {
        if (key == option_table[i].key)
            return option_table[i].opt;
    }
    return std::nullopt;
}

const char *option_name(option opt) {
    for (size_t i = 0; i < ARRAY_SIZE(option_table); i++) {
        if (option_table[i].opt == opt)
            return option_table[i].key;
    }
    return "?";
}

/* Split `line` with shell quoting rules behind `prefix` and make it the base command */
static RESULT apply_command_line(game_draft *draft, option opt, std::vector<std::string> prefix,
                                 const std::string &line) {
    std::vector<std::string> words;
    RETURN_IF_FAILED(split_shell_words(line, &words));

    prefix.insert(prefix.end(), words.begin(), words.end());
    set_command(draft, option_name(opt), std::move(prefix));

    return RESULT_OK;
}

RESULT apply_option(option opt, const toml::node &value, game_draft *draft) {
    switch (opt) {
    case option::cmd:
        if (auto cmd = value.value_exact<std::string>())
            return apply_command_line(draft, opt, {}, *cmd);
        break;
    case option::wine_exe:
        if (auto exe = value.value_exact<std::string>())
            return apply_command_line(draft, opt, {WINE_COMMAND}, *exe);
        break;
    case option::dosbox_config:
        if (auto conf = value.value_exact<std::string>())
            set_command(draft, option_name(opt), {DOSBOX_COMMAND, "-conf", *conf});
        break;
    case option::scummvm_id:
        if (auto scummvm_id = value.value_exact<std::string>())
            set_command(draft, option_name(opt), {SCUMMVM_COMMAND, *scummvm_id});
        break;
    case option::name:
        if (auto name = value.value_exact<std::string>())
            draft->name = std::move(*name);
        break;
    case option::dir:
        if (auto dir = value.value_exact<std::string>())
            draft->dir = std::move(*dir);
        break;
    case option::dir_prefix:
        if (auto prefix = value.value_exact<std::string>())
            draft->dir_prefix = std::move(*prefix);
        break;
    case option::env:
        if (const toml::table *tbl = value.as_table()) {
            env_map environment;
            for (auto &&[key, env_value] : *tbl) {
                if (auto s = env_value.value_exact<std::string>())
                    environment.emplace(std::string(key.str()), std::move(*s));
            }
            draft->env = std::move(environment);
        }
        break;
    case option::tags:
        if (const toml::array *arr = value.as_array()) {
            std::vector<std::string> game_tags;
            for (auto &&elem : *arr) {
                if (auto s = elem.value_exact<std::string>())
                    game_tags.push_back(std::move(*s));
            }
            draft->tags = std::move(game_tags);
        }
        break;
    case option::fps_limit:
        if (auto limit = value.value_exact<int64_t>())
            draft->fps_limit = *limit;
        break;
    case option::installed:
        if (auto installed = value.value_exact<bool>())
            draft->installed = *installed;
        break;
    case option::use_gamescope:
        if (auto b = value.value_exact<bool>())
            draft->use_gamescope = *b;
        break;
    case option::use_mangohud:
        if (auto b = value.value_exact<bool>())
            draft->use_mangohud = *b;
        break;
    case option::use_vk:
        if (auto b = value.value_exact<bool>())
            draft->use_vk = *b;
        break;
    }

    return RESULT_OK;
}

RESULT compile_game(const std::string &id, const toml::table &game_config, const directory_table &directories,
                    const display_settings &settings, game_record *game, compile_error *err) {
    /* Reject typos before anything else */
    for (auto &&[key, value] : game_config) {
        if (!lookup_option(key.str())) {
            err->result = MAKE_RESULT(SEV_ERROR, CAT_CONFIG, E_UNRECOGNIZED_OPTION);
            err->game_id = id;
            err->detail = std::string(key.str());
            return err->result;
        }
    }

    game_draft draft;
    draft.id = id;

    for (auto &&[key, value] : game_config) {
        option opt = *lookup_option(key.str());
        RESULT result = apply_option(opt, value, &draft);
        if (FAILED(result)) {
            err->result = result;
            err->game_id = id;
            err->detail = std::string(key.str());
            return result;
        }
    }

    return finalize_game(std::move(draft), directories, settings, game, err);
}

static std::optional<uint32_t> read_dimension(const toml::table &tbl, const char *key) {
    auto value = tbl[key].value_exact<int64_t>();
    if (!value || *value <= 0 || *value > std::numeric_limits<uint32_t>::max()) {
        if (tbl.contains(key))
            LOG_WARNING("Ignoring invalid settings.%s, using the default", key);
        return std::nullopt;
    }
    return static_cast<uint32_t>(*value);
}

static display_settings read_settings(const toml::table &root) {
    display_settings settings;

    const toml::table *tbl = root["settings"].as_table();
    if (!tbl)
        return settings;

    if (auto width = read_dimension(*tbl, "width"))
        settings.width = *width;
    if (auto height = read_dimension(*tbl, "height"))
        settings.height = *height;

    if (auto b = (*tbl)["use_gamescope"].value_exact<bool>())
        settings.use_gamescope = *b;
    else if (auto b = (*tbl)["use_compositor"].value_exact<bool>())
        settings.use_gamescope = *b;

    return settings;
}

static directory_table read_directories(const toml::table &root) {
    directory_table directories;

    const toml::table *tbl = root["directories"].as_table();
    if (!tbl)
        return directories;

    for (auto &&[alias, value] : *tbl) {
        if (auto path = value.value_exact<std::string>())
            directories.emplace(std::string(alias.str()), std::move(*path));
        else
            LOG_DEBUG("Skipping non-string directory alias: %s", std::string(alias.str()).c_str());
    }

    return directories;
}

RESULT compile_catalog(std::string_view document, game_catalog *catalog, compile_error *err) {
    toml::table root;

    try {
        root = toml::parse(document);
    } catch (const toml::parse_error &e) {
        const auto &where = e.source().begin;
        err->result = MAKE_RESULT(SEV_ERROR, CAT_TOML, E_PARSE_ERROR);
        err->game_id.clear();
        err->detail = fmt::format("TOML parse error at line {}, column {}: {}", where.line, where.column,
                                  e.description());
        return err->result;
    }

    game_catalog result;
    result.settings = read_settings(root);
    result.directories = read_directories(root);

    const toml::table *games = root["games"].as_table();
    if (!games) {
        err->result = MAKE_RESULT(SEV_ERROR, CAT_CONFIG, E_MISSING_GAMES);
        err->game_id.clear();
        err->detail.clear();
        return err->result;
    }

    for (auto &&[key, value] : *games) {
        std::string id(key.str());

        const toml::table *game_config = value.as_table();
        if (!game_config) {
            err->result = MAKE_RESULT(SEV_ERROR, CAT_CONFIG, E_GAME_NOT_TABLE);
            err->game_id = id;
            err->detail.clear();
            return err->result;
        }

        game_record game;
        RETURN_IF_FAILED(compile_game(id, *game_config, result.directories, result.settings, &game, err));
        result.games.emplace(id, std::move(game));
    }

    LOG_DEBUG("Compiled %zu games (gamescope %s, %ux%u)", result.games.size(),
              result.settings.use_gamescope ? "on" : "off", result.settings.width, result.settings.height);

    *catalog = std::move(result);
    return RESULT_OK;
}
