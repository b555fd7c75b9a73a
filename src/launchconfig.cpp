/*
 * Runtime configuration
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "config.h"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

#include "launchconfig.hpp"
#include "util.hpp"

#include "fmt/format.h"
#include "fmt/printf.h"

namespace config {

static std::string s_config_dir;
static std::string s_data_dir;
const char *config_dir = nullptr;
const char *data_dir = nullptr;

/* $<override_env>, else $<xdg_env>/PROG_NAME, else $HOME/<home_suffix>/PROG_NAME */
static std::string resolve_dir(const char *override_env, const char *xdg_env, const char *home_suffix) {
    struct passwd *pw;
    const char *temp_path = getenv(override_env);

    if (temp_path && temp_path[0])
        return expand_path(temp_path);
    if ((temp_path = getenv(xdg_env)) && temp_path[0])
        return fmt::format("{}/{}", temp_path, PROG_NAME);
    if ((temp_path = getenv("HOME")) || ((pw = getpwuid(getuid())) && (temp_path = pw->pw_dir)))
        return fmt::format("{}/{}/{}", temp_path, home_suffix, PROG_NAME);

    return {};
}

static RESULT setup_dir(std::string result, const char *what, std::string *storage, const char **exported) {
    if (result.empty()) {
        fmt::fprintf(stderr, "Error: Could not determine the %s directory\n", what);
        return RESULT_FAIL;
    }

    RESULT ensure_result = ensure_dir(result.c_str());
    if (FAILED(ensure_result)) {
        fmt::fprintf(stderr, "Error: Failed to create or access %s directory: %s\n", what,
                     result_to_string(ensure_result));
        fmt::fprintf(stderr, "Attempted directory: %s\n", result);
        return ensure_result;
    }

    *storage = std::move(result);
    *exported = storage->c_str();

    return RESULT_OK;
}

RESULT setup_config_dir(void) {
    return setup_dir(resolve_dir("GAMELAUNCH_CONFIG_DIR", "XDG_CONFIG_HOME", ".config"), "configuration",
                     &s_config_dir, &config_dir);
}

RESULT setup_data_dir(void) {
    return setup_dir(resolve_dir("GAMELAUNCH_DATA_DIR", "XDG_DATA_HOME", ".local/share"), "data", &s_data_dir,
                     &data_dir);
}

std::string config_file_path(void) { return join_path(config_dir ? config_dir : "", CONFIG_FILE_NAME); }

std::string stats_file_path(void) { return join_path(data_dir ? data_dir : "", STATS_FILE_NAME); }

}; // namespace config
