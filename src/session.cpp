/*
 * Play sessions: launch a game and record its play time
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "log.hpp"
#include "session.hpp"
#include "stats.hpp"

#include "fmt/format.h"

RESULT play_game(const game_record &game, const launch::executor &exec, const char *ledger_path,
                 session_report *report, const session_clock &clock) {
    auto now = [&clock]() { return clock ? clock() : time(nullptr); };

    report->start = now();

    RESULT result = launch::run_game(game, exec, &report->launch);
    if (FAILED(result))
        return result;

    time_t end = now();
    report->elapsed_seconds = end > report->start ? static_cast<uint64_t>(end - report->start) : 0;

    result = stats::record_session(ledger_path, game.id, report->elapsed_seconds, report->start);
    if (FAILED(result)) {
        LOG_RESULT(Level::Error, result, "Could not record play time");
        return RESULT_CATEGORY(result) == CAT_STATS ? result : MAKE_RESULT(SEV_ERROR, CAT_STATS, RESULT_CODE(result));
    }

    return RESULT_OK;
}

std::string format_session(const session_report &report) {
    const uint64_t seconds = report.elapsed_seconds;
    return fmt::format("Play Time: {}h{}m{}s ({}sec)", seconds / 3600, (seconds % 3600) / 60, seconds % 60, seconds);
}
