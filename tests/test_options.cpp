/*
 * games.toml compiler tests
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <stdexcept>

#include <gtest/gtest.h>

#include "options.hpp"

typedef std::vector<std::string> argv_t;

static game_catalog compile_ok(const char *document) {
    game_catalog catalog;
    compile_error err;
    RESULT result = compile_catalog(document, &catalog, &err);
    EXPECT_TRUE(SUCCEEDED(result)) << describe_compile_error(err);
    return catalog;
}

static const game_record &get(const game_catalog &catalog, const char *id) {
    const game_record *game = catalog::find(catalog, id);
    if (!game)
        throw std::runtime_error(std::string("game not compiled: ") + id);
    return *game;
}

TEST(OptionTable, LooksUpEveryKey) {
    const char *keys[] = {"cmd",        "dir",  "dir_prefix",    "dosbox_config", "env",    "fps_limit", "installed",
                          "name",       "tags", "use_gamescope", "use_mangohud",  "use_vk", "wine_exe",  "scummvm_id"};

    for (const char *key : keys) {
        auto opt = lookup_option(key);
        ASSERT_TRUE(opt) << key;
        EXPECT_STREQ(option_name(*opt), key);
    }

    EXPECT_FALSE(lookup_option("use_manohud"));
    EXPECT_FALSE(lookup_option(""));
}

TEST(Compiler, NativeGame) {
    game_catalog catalog = compile_ok(R"(
        [games.morrowind]
        name = "Morrowind"
        cmd = "openmw"
        tags = ["rpg", "bethesda"]
    )");

    const game_record &game = get(catalog, "morrowind");
    EXPECT_EQ(game.name, "Morrowind");
    EXPECT_EQ(game.argv, (argv_t{"openmw"}));
    EXPECT_EQ(game.tags, (argv_t{"rpg", "bethesda"}));
    EXPECT_TRUE(game.installed);
}

TEST(Compiler, CmdKeepsQuotedWordsTogether) {
    game_catalog catalog = compile_ok(R"(
        [games.quake]
        name = "Quake"
        cmd = "quakespasm -basedir '/mnt/my games/quake' -game \"hipnotic\""
    )");

    EXPECT_EQ(get(catalog, "quake").argv, (argv_t{"quakespasm", "-basedir", "/mnt/my games/quake", "-game", "hipnotic"}));
}

TEST(Compiler, UnterminatedQuoteNamesTheKey) {
    game_catalog catalog;
    compile_error err;
    RESULT result = compile_catalog(R"(
        [games.broken]
        name = "Broken"
        cmd = "run 'forever"
    )",
                                    &catalog, &err);

    EXPECT_EQ(RESULT_CODE(result), E_PARSE_ERROR);
    EXPECT_EQ(err.game_id, "broken");
    EXPECT_EQ(err.detail, "cmd");
}

TEST(Compiler, WineExe) {
    game_catalog catalog = compile_ok(R"(
        [games.bg3]
        name = "Baldur's Gate 3"
        wine_exe = "bin/bg3.exe --skip-launcher"
    )");

    EXPECT_EQ(get(catalog, "bg3").argv, (argv_t{"mangohud", "wine", "bin/bg3.exe", "--skip-launcher"}));
}

TEST(Compiler, DosboxConfig) {
    game_catalog catalog = compile_ok(R"(
        [games.sc2k]
        name = "SimCity 2000"
        dosbox_config = "sc2k.conf"
    )");

    EXPECT_EQ(get(catalog, "sc2k").argv, (argv_t{"dosbox", "-conf", "sc2k.conf"}));
}

TEST(Compiler, ScummvmId) {
    game_catalog catalog = compile_ok(R"(
        [games.atlantis]
        name = "Indiana Jones and the Fate of Atlantis"
        scummvm_id = "atlantis"
    )");

    EXPECT_EQ(get(catalog, "atlantis").argv, (argv_t{"scummvm", "atlantis"}));
}

TEST(Compiler, GamescopeWithMangoapp) {
    game_catalog catalog = compile_ok(R"(
        [settings]
        use_gamescope = true

        [games.morrowind]
        name = "Morrowind"
        cmd = "openmw"
        use_mangohud = true
    )");

    EXPECT_EQ(get(catalog, "morrowind").argv, (argv_t{"gamescope", "-W", "1280", "-H", "720", "-f",
                                                      "--force-grab-cursor", "--mangoapp", "--", "openmw"}));
}

TEST(Compiler, GamescopeFrameRateLimit) {
    game_catalog catalog = compile_ok(R"(
        [settings]
        width = 1920
        height = 1080
        use_gamescope = true

        [games.test]
        name = "Test Game"
        cmd = "sh start.sh"
        fps_limit = 60
        use_mangohud = true
    )");

    EXPECT_EQ(get(catalog, "test").argv, (argv_t{"gamescope", "-W", "1920", "-H", "1080", "-f", "--force-grab-cursor",
                                                 "-r", "60", "--mangoapp", "--", "sh", "start.sh"}));
    EXPECT_EQ(catalog.settings.width, 1920u);
    EXPECT_EQ(catalog.settings.height, 1080u);
}

TEST(Compiler, UseCompositorAlias) {
    game_catalog catalog = compile_ok(R"(
        [settings]
        use_compositor = true

        [games.test]
        name = "Test Game"
        cmd = "true"
    )");

    EXPECT_TRUE(catalog.settings.use_gamescope);
    EXPECT_EQ(get(catalog, "test").argv.front(), "gamescope");
}

TEST(Compiler, MangohudFpsLimit) {
    game_catalog catalog = compile_ok(R"(
        [games.test]
        name = "Test Game"
        cmd = "sh start.sh"
        fps_limit = 60
        use_mangohud = true
    )");

    const game_record &game = get(catalog, "test");
    EXPECT_EQ(game.argv, (argv_t{"mangohud", "sh", "start.sh"}));
    EXPECT_EQ(game.environment.at("MANGOHUD_CONFIG"), "fps_limit=60");
}

TEST(Compiler, DoNotUseVulkan) {
    game_catalog catalog = compile_ok(R"(
        [games.testgame]
        name = "Test Game"
        dir = "test_game_dir"
        wine_exe = "Test.exe"
        use_vk = false
    )");

    const game_record &game = get(catalog, "testgame");
    EXPECT_EQ(game.argv, (argv_t{"mangohud", "wine", "Test.exe"}));
    EXPECT_EQ(game.environment.at("WINEDLLOVERRIDES"), "*d3d9,*d3d10,*d3d10_1,*d3d10core,*d3d11,*dxgi=b");
}

TEST(Compiler, EnvironmentTable) {
    game_catalog catalog = compile_ok(R"(
        [games.bg3]
        name = "Baldur's Gate 3"
        wine_exe = "bg3.exe"
        env = { WINEPREFIX = "/games/pfx", DXVK_HUD = "fps", IGNORED = 3 }
    )");

    const env_map &env = get(catalog, "bg3").environment;
    EXPECT_EQ(env.size(), 2u);
    EXPECT_EQ(env.at("WINEPREFIX"), "/games/pfx");
    EXPECT_EQ(env.at("DXVK_HUD"), "fps");
}

TEST(Compiler, DirFromDirectoriesTable) {
    game_catalog catalog = compile_ok(R"(
        [directories]
        test_game_dir = "/home/test/test_game"

        [games.testgame]
        name = "Test Game"
        dir = "test_game_dir"
        cmd = "./test_game"
    )");

    const game_record &game = get(catalog, "testgame");
    ASSERT_TRUE(game.working_directory);
    EXPECT_EQ(*game.working_directory, "/home/test/test_game");
}

TEST(Compiler, DirPrefix) {
    game_catalog catalog = compile_ok(R"(
        [directories]
        quake = "/mnt/games/quake"

        [games.quake]
        name = "Quake"
        dir_prefix = "quake"
        dir = "id1"
        cmd = "quakespasm"

        [games.hipnotic]
        name = "Scourge of Armagon"
        dir_prefix = "quake"
        cmd = "quakespasm -game hipnotic"
    )");

    EXPECT_EQ(*get(catalog, "quake").working_directory, "/mnt/games/quake/id1");
    EXPECT_EQ(*get(catalog, "hipnotic").working_directory, "/mnt/games/quake");
}

TEST(Compiler, NonexistentDirectoryPrefix) {
    game_catalog catalog;
    compile_error err;
    RESULT result = compile_catalog(R"(
        [games.test]
        name = "Test Game"
        dir_prefix = "bad_dir"
        cmd = "sh start.sh"
    )",
                                    &catalog, &err);

    EXPECT_EQ(RESULT_CODE(result), E_NO_SUCH_DIR_PREFIX);
    EXPECT_EQ(err.game_id, "test");
    EXPECT_EQ(err.detail, "bad_dir");
}

TEST(Compiler, UnrecognizedOption) {
    game_catalog catalog;
    compile_error err;
    RESULT result = compile_catalog(R"(
        [games.testgame]
        name = "Test Game"
        dir = "test_game_dir"
        cmd = "./test_game"
        use_manohud = true # note the spelling error
    )",
                                    &catalog, &err);

    EXPECT_EQ(RESULT_CODE(result), E_UNRECOGNIZED_OPTION);
    EXPECT_EQ(RESULT_CATEGORY(result), CAT_CONFIG);
    EXPECT_EQ(err.game_id, "testgame");
    EXPECT_EQ(err.detail, "use_manohud");
}

TEST(Compiler, UnrecognizedOptionBeatsOtherErrors) {
    game_catalog catalog;
    compile_error err;
    RESULT result = compile_catalog(R"(
        [games.testgame]
        dir_prefix = "missing"
        colour = "blue"
    )",
                                    &catalog, &err);

    EXPECT_EQ(RESULT_CODE(result), E_UNRECOGNIZED_OPTION);
    EXPECT_EQ(err.detail, "colour");
}

TEST(Compiler, WrongTypesAreIgnored) {
    game_catalog catalog = compile_ok(R"(
        [games.test]
        name = "Test Game"
        cmd = "true"
        fps_limit = "sixty"
        use_mangohud = "yes"
        tags = "not-a-list"
        installed = 0
    )");

    const game_record &game = get(catalog, "test");
    EXPECT_EQ(game.argv, (argv_t{"true"}));
    EXPECT_TRUE(game.environment.empty());
    EXPECT_TRUE(game.tags.empty());
    EXPECT_TRUE(game.installed);
}

TEST(Compiler, WrongTypedCommandIsMissing) {
    game_catalog catalog;
    compile_error err;
    RESULT result = compile_catalog(R"(
        [games.test]
        name = "Test Game"
        cmd = ["a", "b"]
    )",
                                    &catalog, &err);

    EXPECT_EQ(RESULT_CODE(result), E_MISSING_COMMAND);
}

TEST(Compiler, ConflictingCommands) {
    game_catalog catalog;
    compile_error err;
    RESULT result = compile_catalog(R"(
        [games.test]
        name = "Test Game"
        cmd = "true"
        wine_exe = "game.exe"
    )",
                                    &catalog, &err);

    EXPECT_EQ(RESULT_CODE(result), E_CONFLICTING_COMMAND);
    EXPECT_EQ(err.game_id, "test");
}

TEST(Compiler, MissingGamesTable) {
    game_catalog catalog;
    compile_error err;
    RESULT result = compile_catalog("[settings]\nwidth = 800\n", &catalog, &err);

    EXPECT_EQ(RESULT_CODE(result), E_MISSING_GAMES);
}

TEST(Compiler, GameMustBeATable) {
    game_catalog catalog;
    compile_error err;
    RESULT result = compile_catalog("[games]\nquake = \"quakespasm\"\n", &catalog, &err);

    EXPECT_EQ(RESULT_CODE(result), E_GAME_NOT_TABLE);
    EXPECT_EQ(err.game_id, "quake");
}

TEST(Compiler, TomlSyntaxError) {
    game_catalog catalog;
    compile_error err;
    RESULT result = compile_catalog(R"(
        [games.test]
        name = "Test Game"
        cmd = "sh start.sh"

        [games.test]
        name = "Test Game"
        cmd = "sh start.sh"
    )",
                                    &catalog, &err);

    EXPECT_EQ(RESULT_CATEGORY(result), CAT_TOML);
    EXPECT_EQ(RESULT_CODE(result), E_PARSE_ERROR);
    EXPECT_NE(err.detail.find("TOML parse error at line"), std::string::npos) << err.detail;
}

TEST(Compiler, FirstErrorAbortsCatalog) {
    game_catalog catalog;
    catalog.games.emplace("stale", game_record{});
    compile_error err;
    RESULT result = compile_catalog(R"(
        [games.good]
        name = "Good"
        cmd = "true"

        [games.bad]
        cmd = "true"
    )",
                                    &catalog, &err);

    EXPECT_EQ(RESULT_CODE(result), E_MISSING_NAME);
    EXPECT_EQ(err.game_id, "bad");
    /* the output catalog is untouched */
    EXPECT_EQ(catalog.games.size(), 1u);
    EXPECT_TRUE(catalog.games.contains("stale"));
}

TEST(Compiler, NotInstalled) {
    game_catalog catalog = compile_ok(R"(
        [games.testgame]
        name = "Test Game"
        wine_exe = "Test.exe"
        installed = false
    )");

    EXPECT_FALSE(get(catalog, "testgame").installed);
}

TEST(Compiler, GameUseGamescopeFollowsSettings) {
    game_catalog off = compile_ok(R"(
        [games.test]
        name = "Test Game"
        cmd = "true"
        use_gamescope = true
    )");
    EXPECT_EQ(get(off, "test").argv, (argv_t{"true"}));

    game_catalog on = compile_ok(R"(
        [settings]
        use_gamescope = true

        [games.test]
        name = "Test Game"
        cmd = "true"
        use_gamescope = false
    )");
    EXPECT_EQ(get(on, "test").argv.front(), "gamescope");
}
