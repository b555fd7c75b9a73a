/*
 * Catalog query tests
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <set>

#include <gtest/gtest.h>

#include "catalog.hpp"
#include "options.hpp"

typedef std::vector<std::string> lines_t;

static game_catalog sample_catalog(void) {
    game_catalog catalog;
    compile_error err;
    RESULT result = compile_catalog(R"(
        [games.testgame]
        name = "Test Game"
        wine_exe = "Test.exe"
        installed = false
        tags = ["wine"]

        [games.testgame2]
        name = "Test Game 2"
        wine_exe = "TestGame2.exe"
        tags = ["wine", "rpg"]

        [games.quake]
        name = "Quake"
        cmd = "quakespasm"
        tags = ["fps", "old"]

        [games.morrowind]
        name = "Morrowind"
        cmd = "openmw"
        tags = ["rpg", "old"]
    )",
                                    &catalog, &err);
    EXPECT_TRUE(SUCCEEDED(result)) << describe_compile_error(err);
    return catalog;
}

TEST(Catalog, ListSkipsUninstalledGames) {
    game_catalog catalog = sample_catalog();

    EXPECT_EQ(catalog::list_games(catalog, {}),
              (lines_t{"morrowind - Morrowind", "quake - Quake", "testgame2 - Test Game 2"}));
}

TEST(Catalog, ListBySelectors) {
    game_catalog catalog = sample_catalog();

    EXPECT_EQ(catalog::list_games(catalog, {"rpg"}), (lines_t{"morrowind - Morrowind", "testgame2 - Test Game 2"}));
    EXPECT_EQ(catalog::list_games(catalog, {"rpg,!wine"}), (lines_t{"morrowind - Morrowind"}));
    EXPECT_EQ(catalog::list_games(catalog, {"fps", "wine"}), (lines_t{"quake - Quake", "testgame2 - Test Game 2"}));
    EXPECT_EQ(catalog::list_games(catalog, {"quake"}), (lines_t{"quake - Quake"}));
    EXPECT_TRUE(catalog::list_games(catalog, {"testgame"}).empty());
}

TEST(Catalog, FindById) {
    game_catalog catalog = sample_catalog();

    ASSERT_NE(catalog::find(catalog, "quake"), nullptr);
    EXPECT_EQ(catalog::find(catalog, "quake")->name, "Quake");
    EXPECT_EQ(catalog::find(catalog, "doom"), nullptr);
    /* uninstalled games can still be looked up */
    EXPECT_NE(catalog::find(catalog, "testgame"), nullptr);
}

TEST(Catalog, AllTagsSortedAndUnique) {
    game_catalog catalog = sample_catalog();

    EXPECT_EQ(catalog::all_tags(catalog), (lines_t{"fps", "old", "rpg", "wine"}));
}

TEST(Catalog, PickRandomStaysInSelection) {
    game_catalog catalog = sample_catalog();
    std::mt19937 rng(1234);
    std::set<std::string> picked;

    for (int i = 0; i < 200; i++) {
        const game_record *game = nullptr;
        ASSERT_TRUE(SUCCEEDED(catalog::pick_random(catalog, {"old"}, rng, &game)));
        ASSERT_NE(game, nullptr);
        picked.insert(game->id);
    }

    EXPECT_EQ(picked, (std::set<std::string>{"morrowind", "quake"}));
}

TEST(Catalog, PickRandomNeverPicksUninstalled) {
    game_catalog catalog = sample_catalog();
    std::mt19937 rng(99);

    for (int i = 0; i < 100; i++) {
        const game_record *game = nullptr;
        ASSERT_TRUE(SUCCEEDED(catalog::pick_random(catalog, {}, rng, &game)));
        EXPECT_NE(game->id, "testgame");
    }
}

TEST(Catalog, PickRandomWithoutMatch) {
    game_catalog catalog = sample_catalog();
    std::mt19937 rng(7);
    const game_record *game = nullptr;

    RESULT result = catalog::pick_random(catalog, {"testgame"}, rng, &game);

    EXPECT_EQ(RESULT_CODE(result), E_NOT_FOUND);
    EXPECT_EQ(game, nullptr);
}
