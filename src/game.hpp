/*
 * Resolved game records
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#define DEFAULT_WIDTH 1280
#define DEFAULT_HEIGHT 720

/* [settings] table of the catalog */
struct display_settings {
    uint32_t width = DEFAULT_WIDTH;
    uint32_t height = DEFAULT_HEIGHT;
    bool use_gamescope = false;
};

/* [directories] table: alias -> path */
typedef std::map<std::string, std::string> directory_table;

typedef std::map<std::string, std::string> env_map;

/* Everything needed to launch one catalog entry. Built once by the option compiler, never modified. */
struct game_record {
    std::string id;
    std::string name;
    std::optional<std::string> working_directory;
    std::vector<std::string> argv; /* never empty */
    env_map environment;           /* overlay on top of the inherited environment */
    std::vector<std::string> tags; /* configuration order */
    bool installed = true;
};

/* "<id> - <name>" */
std::string format_game(const game_record &game);

/* True if any selector matches the game's tags, or the game's id taken as its only tag */
bool game_matches_tags(const game_record &game, const std::vector<std::string> &selectors);
