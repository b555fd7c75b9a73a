/*
 * Play time ledger
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>
#include <vector>

#include "result.hpp"

namespace stats {

/* Local time, no offset is stored: a line is read back with the offset in effect when it is parsed */
#define TIMESTAMP_FORMAT "%Y-%m-%d %H:%M:%S"

struct game_stats {
    std::string id; /* no tabs */
    uint32_t play_time_seconds;
    time_t last_played;
    std::string line; /* text the record was read from, written back as is until the record changes */
};

/* Add to the cumulative play time. Returns E_OVERFLOW and leaves `stats` untouched instead of wrapping. */
RESULT add_time(game_stats *stats, uint64_t seconds);

/* "<id>\t<seconds>\t<YYYY-MM-DD HH:MM:SS>" */
std::string to_tsv(const game_stats &stats);

/* Returns E_PARSE_ERROR (CAT_STATS) for a malformed line */
RESULT from_tsv(std::string_view line, game_stats *stats);

/* 5415 -> "1h30m15s", 2700 -> "45m", 0 -> "" */
std::string format_play_time(uint64_t seconds);

std::string format_timestamp(time_t timestamp);

/* Returns E_PARSE_ERROR (CAT_STATS) unless `text` is exactly YYYY-MM-DD HH:MM:SS */
RESULT parse_timestamp(std::string_view text, time_t *timestamp);

/* Read every record. A missing ledger is an empty one. Blank lines are skipped. */
RESULT read_ledger(const char *path, std::vector<game_stats> *ledger);

/* Add a session to the record for `id`, or append a new record if there is none */
RESULT merge_session(std::vector<game_stats> *ledger, const std::string &id, uint64_t seconds, time_t start);

/* One line per record, each terminated by a newline. Unchanged records keep their original text. */
std::string serialize_ledger(const std::vector<game_stats> &ledger);

/* Rewrite the whole ledger file */
RESULT write_ledger(const char *path, const std::vector<game_stats> &ledger);

/* read_ledger() + merge_session() + write_ledger() */
RESULT record_session(const char *path, const std::string &id, uint64_t seconds, time_t start);

/* Returns E_NOT_FOUND (CAT_STATS) if the game has never been played */
RESULT find_stats(const char *path, const std::string &id, game_stats *stats);

}; // namespace stats
