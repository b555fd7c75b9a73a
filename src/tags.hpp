/*
 * Tag group queries
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tags {

#define TAG_SEPARATOR ','
#define TAG_NOT_PREFIX '!'

struct tag {
    std::string name;
    bool negated;
};

/* A conjunction of possibly negated tags, e.g. "rpg,!unfinished" */
struct tag_group {
    std::vector<tag> tags;
};

/* Split a query on ',' and strip one leading '!' per literal. Never fails, no escaping. */
tag_group parse(std::string_view query);

/* True if every literal of the group is satisfied by `candidate_tags` */
bool matches(const tag_group &group, const std::vector<std::string> &candidate_tags);

}; // namespace tags
