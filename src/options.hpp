/*
 * Game option compiler: games.toml -> game records
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <toml++/toml.hpp>

#include "builder.hpp"
#include "catalog.hpp"
#include "result.hpp"

/* Every key a [games.<id>] table may contain */
enum class option : uint8_t {
    cmd,
    dir,
    dir_prefix,
    dosbox_config,
    env,
    fps_limit,
    installed,
    name,
    scummvm_id,
    tags,
    use_gamescope,
    use_mangohud,
    use_vk,
    wine_exe,
};

/* std::nullopt for keys that are not options */
std::optional<option> lookup_option(std::string_view key);

const char *option_name(option opt);

/* Apply one option value to the draft. A value of the wrong type is ignored.
 * Returns E_PARSE_ERROR if a command line cannot be split. */
RESULT apply_option(option opt, const toml::node &value, game_draft *draft);

/* Compile one [games.<id>] table. Unknown keys fail with E_UNRECOGNIZED_OPTION before any option is applied. */
RESULT compile_game(const std::string &id, const toml::table &game_config, const directory_table &directories,
                    const display_settings &settings, game_record *game, compile_error *err);

/* Parse a whole games.toml document. The first error aborts the catalog. */
RESULT compile_catalog(std::string_view document, game_catalog *catalog, compile_error *err);
