/*
 * Per-game command resolution
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "game.hpp"
#include "result.hpp"

#define WINE_COMMAND "wine"
#define MANGOHUD_COMMAND "mangohud"
#define GAMESCOPE_COMMAND "gamescope"
#define MANGOHUD_CONFIG_ENV "MANGOHUD_CONFIG"
#define WINEDLLOVERRIDES_ENV "WINEDLLOVERRIDES"
/* builtin wined3d instead of DXVK/vkd3d */
#define WINED3D_OVERRIDES "*d3d9,*d3d10,*d3d10_1,*d3d10core,*d3d11,*dxgi=b"

/* Details for a failed catalog compilation, `result` holds the error code */
struct compile_error {
    RESULT result = RESULT_OK;
    std::string game_id;
    std::string detail; /* option key, directory alias, conflicting keys or parser message */
};

/* One line, user facing */
std::string describe_compile_error(const compile_error &err);

/*
 * The options of one game as they were read, before any cross-field logic.
 * Option handlers only assign fields, so the order in which keys are applied never matters;
 * all validation happens in finalize_game().
 */
struct game_draft {
    std::string id;
    std::optional<std::string> name;
    std::vector<std::string> command;
    std::vector<std::string> command_sources; /* keys that assigned `command` */
    std::string dir;
    std::string dir_prefix;
    env_map env;
    std::vector<std::string> tags;
    std::optional<int64_t> fps_limit;
    std::optional<bool> use_mangohud;
    std::optional<bool> use_gamescope; /* accepted, the layer follows settings.use_gamescope */
    std::optional<bool> use_vk;
    bool installed = true;
};

/* Assign the base command and remember which option did it */
void set_command(game_draft *draft, const char *source, std::vector<std::string> command);

/* Is the base command a Wine invocation? */
bool is_wine_command(const std::vector<std::string> &command);

/* Validate the draft and wrap its command. On failure `err` names the game and the offending value. */
RESULT finalize_game(game_draft draft, const directory_table &directories, const display_settings &settings,
                     game_record *game, compile_error *err);
