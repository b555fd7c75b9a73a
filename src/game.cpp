/*
 * Resolved game records
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "game.hpp"
#include "tags.hpp"

#include "fmt/format.h"

std::string format_game(const game_record &game) { return fmt::format("{} - {}", game.id, game.name); }

bool game_matches_tags(const game_record &game, const std::vector<std::string> &selectors) {
    const std::vector<std::string> id_tag = {game.id};

    for (const auto &selector : selectors) {
        tags::tag_group group = tags::parse(selector);
        if (tags::matches(group, game.tags) || tags::matches(group, id_tag))
            return true;
    }

    return false;
}
