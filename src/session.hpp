/*
 * Play sessions: launch a game and record its play time
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <cstdint>
#include <ctime>
#include <functional>
#include <string>

#include "game.hpp"
#include "launch.hpp"
#include "result.hpp"

struct session_report {
    time_t start = 0;
    uint64_t elapsed_seconds = 0;
    launch::launch_error launch; /* set when the game could not be run */
};

/* Wall clock source, replaceable for tests */
typedef std::function<time_t(void)> session_clock;

/*
 * Launch `game` through `exec` and add the session to the ledger at `ledger_path`.
 * Launch failures come back as CAT_LAUNCH results and record nothing; a CAT_STATS result means the game ran
 * (report is filled in) but the ledger could not be updated.
 */
RESULT play_game(const game_record &game, const launch::executor &exec, const char *ledger_path,
                 session_report *report, const session_clock &clock = nullptr);

/* "Play Time: 1h2m3s (3723sec)" */
std::string format_session(const session_report &report);
