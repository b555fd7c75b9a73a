/*
 * The compiled game catalog
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <set>

#include "catalog.hpp"
#include "log.hpp"

namespace catalog {

const game_record *find(const game_catalog &catalog, const std::string &id) {
    auto it = catalog.games.find(id);
    return it == catalog.games.end() ? nullptr : &it->second;
}

static bool selected(const game_record &game, const std::vector<std::string> &selectors) {
    return game.installed && (selectors.empty() || game_matches_tags(game, selectors));
}

std::vector<std::string> list_games(const game_catalog &catalog, const std::vector<std::string> &selectors) {
    std::vector<std::string> lines;

    for (const auto &[id, game] : catalog.games) {
        if (selected(game, selectors))
            lines.push_back(format_game(game));
    }

    return lines;
}

std::vector<std::string> all_tags(const game_catalog &catalog) {
    std::set<std::string> unique;

    for (const auto &[id, game] : catalog.games)
        unique.insert(game.tags.begin(), game.tags.end());

    return {unique.begin(), unique.end()};
}

RESULT pick_random(const game_catalog &catalog, const std::vector<std::string> &selectors, std::mt19937 &rng,
                   const game_record **game) {
    std::vector<const game_record *> candidates;

    for (const auto &[id, record] : catalog.games) {
        if (selected(record, selectors))
            candidates.push_back(&record);
    }

    if (candidates.empty()) {
        LOG_DEBUG("No installed game matches %zu selector(s)", selectors.size());
        return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_NOT_FOUND);
    }

    std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
    *game = candidates[pick(rng)];

    return RESULT_OK;
}

}; // namespace catalog
