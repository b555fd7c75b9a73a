/*
 * Play time ledger
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <cctype>
#include <charconv>
#include <limits>

#include "log.hpp"
#include "stats.hpp"
#include "util.hpp"

#include "fmt/format.h"

#define SECONDS_PER_HOUR (60 * 60)
#define SECONDS_PER_MINUTE 60

namespace stats {

static inline RESULT parse_error(void) { return MAKE_RESULT(SEV_ERROR, CAT_STATS, E_PARSE_ERROR); }

RESULT add_time(game_stats *stats, uint64_t seconds) {
    if (seconds > std::numeric_limits<uint32_t>::max() - stats->play_time_seconds) {
        LOG_ERROR("Play time for %s would overflow (%u + %llu seconds)", stats->id.c_str(), stats->play_time_seconds,
                  (unsigned long long)seconds);
        return MAKE_RESULT(SEV_ERROR, CAT_STATS, E_OVERFLOW);
    }

    stats->play_time_seconds += static_cast<uint32_t>(seconds);
    return RESULT_OK;
}

std::string format_timestamp(time_t timestamp) {
    struct tm tm_info;
    char time_str[32];

    localtime_r(&timestamp, &tm_info);
    strftime(time_str, sizeof(time_str), TIMESTAMP_FORMAT, &tm_info);

    return time_str;
}

static bool parse_digits(std::string_view text, size_t pos, size_t len, int *value) {
    int result = 0;
    for (size_t i = pos; i < pos + len; i++) {
        if (!isdigit((unsigned char)text[i]))
            return false;
        result = result * 10 + (text[i] - '0');
    }
    *value = result;
    return true;
}

RESULT parse_timestamp(std::string_view text, time_t *timestamp) {
    /* 0123456789012345678
     * YYYY-MM-DD HH:MM:SS */
    struct tm tm_info = {};

    if (text.size() != 19 || text[4] != '-' || text[7] != '-' || text[10] != ' ' || text[13] != ':' ||
        text[16] != ':')
        return parse_error();

    int year, month, day, hour, minute, second;
    if (!parse_digits(text, 0, 4, &year) || !parse_digits(text, 5, 2, &month) || !parse_digits(text, 8, 2, &day) ||
        !parse_digits(text, 11, 2, &hour) || !parse_digits(text, 14, 2, &minute) ||
        !parse_digits(text, 17, 2, &second))
        return parse_error();

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
        return parse_error();

    tm_info.tm_year = year - 1900;
    tm_info.tm_mon = month - 1;
    tm_info.tm_mday = day;
    tm_info.tm_hour = hour;
    tm_info.tm_min = minute;
    tm_info.tm_sec = second;
    tm_info.tm_isdst = -1; /* whatever offset applies locally at that date */

    *timestamp = mktime(&tm_info);
    return RESULT_OK;
}

std::string to_tsv(const game_stats &stats) {
    return fmt::format("{}\t{}\t{}", stats.id, stats.play_time_seconds, format_timestamp(stats.last_played));
}

RESULT from_tsv(std::string_view line, game_stats *stats) {
    const std::string_view original = line;

    if (!line.empty() && line.back() == '\r')
        line.remove_suffix(1);

    size_t first = line.find('\t');
    if (first == std::string_view::npos)
        return parse_error();
    size_t second = line.find('\t', first + 1);
    if (second == std::string_view::npos || line.find('\t', second + 1) != std::string_view::npos)
        return parse_error();

    std::string_view id = line.substr(0, first);
    std::string_view seconds_field = line.substr(first + 1, second - first - 1);
    std::string_view time_field = line.substr(second + 1);

    uint32_t play_time = 0;
    const char *end = seconds_field.data() + seconds_field.size();
    auto [ptr, ec] = std::from_chars(seconds_field.data(), end, play_time);
    if (seconds_field.empty() || ec != std::errc() || ptr != end)
        return parse_error();

    time_t last_played;
    RETURN_IF_FAILED(parse_timestamp(time_field, &last_played));

    stats->id = std::string(id);
    stats->play_time_seconds = play_time;
    stats->last_played = last_played;
    stats->line = std::string(original);

    return RESULT_OK;
}

std::string format_play_time(uint64_t seconds) {
    const uint64_t hours = seconds / SECONDS_PER_HOUR;
    const uint64_t minutes = (seconds % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE;
    const uint64_t rest = seconds % SECONDS_PER_MINUTE;
    std::string formatted;

    if (hours > 0)
        formatted += fmt::format("{}h", hours);
    if (minutes > 0)
        formatted += fmt::format("{}m", minutes);
    if (rest > 0)
        formatted += fmt::format("{}s", rest);

    return formatted;
}

RESULT read_ledger(const char *path, std::vector<game_stats> *ledger) {
    std::string contents;

    ledger->clear();

    RESULT result = read_file(path, &contents);
    if (FAILED(result)) {
        if (RESULT_CODE(result) != E_FILE_NOT_FOUND)
            LOG_RESULT(Level::Warning, result, "Could not read the stats file, starting a new one");
        return RESULT_OK;
    }

    size_t line_no = 0;
    size_t start = 0;
    while (start < contents.size()) {
        size_t end = contents.find('\n', start);
        if (end == std::string::npos)
            end = contents.size();

        std::string_view line(contents.data() + start, end - start);
        start = end + 1;
        line_no++;

        if (line.empty() || line == "\r")
            continue;

        game_stats stats;
        result = from_tsv(line, &stats);
        if (FAILED(result)) {
            LOG_ERROR("Malformed stats line %zu in %s", line_no, path);
            return result;
        }
        ledger->push_back(std::move(stats));
    }

    return RESULT_OK;
}

RESULT merge_session(std::vector<game_stats> *ledger, const std::string &id, uint64_t seconds, time_t start) {
    for (auto &stats : *ledger) {
        if (stats.id == id) {
            RETURN_IF_FAILED(add_time(&stats, seconds));
            stats.last_played = start;
            stats.line.clear();
            return RESULT_OK;
        }
    }

    game_stats stats = {id, 0, start, {}};
    RETURN_IF_FAILED(add_time(&stats, seconds));
    ledger->push_back(std::move(stats));

    return RESULT_OK;
}

std::string serialize_ledger(const std::vector<game_stats> &ledger) {
    std::string out;

    for (const auto &stats : ledger) {
        out += stats.line.empty() ? to_tsv(stats) : stats.line;
        out.push_back('\n');
    }

    return out;
}

RESULT write_ledger(const char *path, const std::vector<game_stats> &ledger) {
    RESULT result = write_file_replace(path, serialize_ledger(ledger));
    if (FAILED(result)) {
        LOG_RESULT(Level::Error, result, "Could not write the stats file");
        return MAKE_RESULT(SEV_ERROR, CAT_STATS, RESULT_CODE(result));
    }
    return RESULT_OK;
}

RESULT record_session(const char *path, const std::string &id, uint64_t seconds, time_t start) {
    std::vector<game_stats> ledger;

    if (id.find('\t') != std::string::npos || id.find('\n') != std::string::npos)
        return MAKE_RESULT(SEV_ERROR, CAT_STATS, E_INVALID_ARG);

    RETURN_IF_FAILED(read_ledger(path, &ledger));
    RETURN_IF_FAILED(merge_session(&ledger, id, seconds, start));
    RETURN_IF_FAILED(write_ledger(path, ledger));

    LOG_DEBUG("Recorded %llu seconds for %s in %s", (unsigned long long)seconds, id.c_str(), path);
    return RESULT_OK;
}

RESULT find_stats(const char *path, const std::string &id, game_stats *stats) {
    std::vector<game_stats> ledger;

    RETURN_IF_FAILED(read_ledger(path, &ledger));

    for (auto &entry : ledger) {
        if (entry.id == id) {
            *stats = std::move(entry);
            return RESULT_OK;
        }
    }

    return MAKE_RESULT(SEV_ERROR, CAT_STATS, E_NOT_FOUND);
}

}; // namespace stats
