/*
 * Tag group queries
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <algorithm>
#include <unordered_set>

#include "tags.hpp"

namespace tags {

tag_group parse(std::string_view query) {
    tag_group group;
    size_t start = 0;

    for (;;) {
        size_t end = query.find(TAG_SEPARATOR, start);
        std::string_view literal = query.substr(start, end == std::string_view::npos ? end : end - start);

        tag t{std::string(literal), false};
        if (!literal.empty() && literal.front() == TAG_NOT_PREFIX) {
            t.name.erase(0, 1);
            t.negated = true;
        }
        group.tags.push_back(std::move(t));

        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }

    return group;
}

bool matches(const tag_group &group, const std::vector<std::string> &candidate_tags) {
    std::unordered_set<std::string_view> tag_set(candidate_tags.begin(), candidate_tags.end());

    return std::all_of(group.tags.begin(), group.tags.end(), [&tag_set](const tag &t) {
        return tag_set.contains(t.name) != t.negated;
    });
}

}; // namespace tags
