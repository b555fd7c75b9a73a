/*
 * The compiled game catalog
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <map>
#include <random>
#include <string>
#include <vector>

#include "game.hpp"
#include "result.hpp"

struct game_catalog {
    std::map<std::string, game_record> games; /* keyed (and so sorted) by id */
    display_settings settings;
    directory_table directories;
};

namespace catalog {

/* nullptr if there is no game with this id */
const game_record *find(const game_catalog &catalog, const std::string &id);

/* "<id> - <name>" for every installed game matching any selector (all installed games without selectors),
 * in id order */
std::vector<std::string> list_games(const game_catalog &catalog, const std::vector<std::string> &selectors);

/* Every tag used by any game, sorted and without duplicates */
std::vector<std::string> all_tags(const game_catalog &catalog);

/* Pick one installed game matching the selectors uniformly at random
 * Returns E_NOT_FOUND if no game qualifies */
RESULT pick_random(const game_catalog &catalog, const std::vector<std::string> &selectors, std::mt19937 &rng,
                   const game_record **game);

}; // namespace catalog
