/*
 * Runtime configuration
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <string>

#include "result.hpp"

#define CONFIG_FILE_NAME "games.toml"
#define STATS_FILE_NAME "game_stats.tsv"

namespace config {
    RESULT setup_config_dir(void);
    RESULT setup_data_dir(void);

    /* Path of the games.toml catalog inside config_dir */
    std::string config_file_path(void);
    /* Path of the play time ledger inside data_dir */
    std::string stats_file_path(void);

    /* The configuration path, set at startup in main() */
    extern const char *config_dir;
    /* The data path (ledger and log file), set at startup in main() */
    extern const char *data_dir;
};
