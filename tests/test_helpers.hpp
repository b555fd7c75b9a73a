/*
 * Shared test fixtures
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

#include <gtest/gtest.h>

#include "util.hpp"

/* A scratch directory removed after each test, with the local time zone pinned to UTC */
class ScratchDirTest : public ::testing::Test {
  protected:
    void SetUp() override {
        saved_tz = getenv("TZ") ? std::optional<std::string>(getenv("TZ")) : std::nullopt;
        setenv("TZ", "UTC", 1);
        tzset();

        char templ[] = "/tmp/gamelaunch-test-XXXXXX";
        ASSERT_NE(mkdtemp(templ), nullptr);
        dir = templ;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);

        if (saved_tz)
            setenv("TZ", saved_tz->c_str(), 1);
        else
            unsetenv("TZ");
        tzset();
    }

    std::string path(const char *name) const { return join_path(dir, name); }

    std::string slurp(const std::string &file) const {
        std::string contents;
        EXPECT_TRUE(SUCCEEDED(read_file(file.c_str(), &contents))) << file;
        return contents;
    }

    void spit(const std::string &file, const std::string &contents) const {
        ASSERT_TRUE(SUCCEEDED(write_file_replace(file.c_str(), contents))) << file;
    }

    std::string dir;

  private:
    std::optional<std::string> saved_tz;
};
