#include "settings.h"
#include "usage_common.h"

#include <gtest/gtest.h>

#include <cstdio>

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        app_log_set_file("");
        char tmpl[] = "/tmp/pinch_settings_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        dir_ = tmpl;
        path_ = dir_ + "/pinch/settings.json";
    }

    void TearDown() override {
        std::remove(path_.c_str());
        rmdir((dir_ + "/pinch").c_str());
        rmdir(dir_.c_str());
    }

    void write_file(const std::string& content) {
        ASSERT_TRUE(ensure_dir_exists(dir_ + "/pinch", 0700));
        std::ofstream f(path_, std::ios::trunc);
        f << content;
    }

    std::string dir_;
    std::string path_;
};

TEST_F(SettingsTest, ClampPollInterval) {
    EXPECT_EQ(clamp_poll_interval(1), 15);
    EXPECT_EQ(clamp_poll_interval(15), 15);
    EXPECT_EQ(clamp_poll_interval(45), 45);
    EXPECT_EQ(clamp_poll_interval(120), 120);
    EXPECT_EQ(clamp_poll_interval(3600), 120);
}

TEST_F(SettingsTest, MissingFileGivesDefaults) {
    EXPECT_FALSE(settings_exist(path_));
    Settings s = load_settings(path_);
    EXPECT_EQ(s.poll_interval, kPollIntervalDefault);
    EXPECT_FALSE(s.autostart);
    EXPECT_EQ(s.theme, "auto");
}

TEST_F(SettingsTest, SaveThenLoad) {
    Settings s;
    s.poll_interval = 60;
    s.autostart = true;
    s.theme = "dark";
    ASSERT_TRUE(save_settings(path_, s));
    EXPECT_TRUE(settings_exist(path_));

    Settings loaded = load_settings(path_);
    EXPECT_EQ(loaded.poll_interval, 60);
    EXPECT_TRUE(loaded.autostart);
    EXPECT_EQ(loaded.theme, "dark");
}

TEST_F(SettingsTest, SavedFileIsOwnerOnly) {
    ASSERT_TRUE(save_settings(path_, Settings()));
    struct stat st;
    ASSERT_EQ(stat(path_.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST_F(SettingsTest, OutOfRangeIntervalIsClamped) {
    write_file(R"({"poll_interval": 5})");
    EXPECT_EQ(load_settings(path_).poll_interval, 15);
}

TEST_F(SettingsTest, HugeIntervalClampsToMaximum) {
    write_file(R"({"poll_interval": 3000000000})");
    EXPECT_EQ(load_settings(path_).poll_interval, 120);

    write_file(R"({"poll_interval": 18446744073709551615})");
    EXPECT_EQ(load_settings(path_).poll_interval, 120);

    write_file(R"({"poll_interval": -3000000000})");
    EXPECT_EQ(load_settings(path_).poll_interval, 15);
}

TEST_F(SettingsTest, UnknownKeysAreDroppedOnSave) {
    write_file(R"({"poll_interval": 60, "access_token": "secret", "window_x": 10})");
    Settings s = load_settings(path_);
    EXPECT_EQ(s.poll_interval, 60);
    ASSERT_TRUE(save_settings(path_, s));

    std::ifstream f(path_);
    json j = json::parse(f);
    EXPECT_EQ(j.size(), 3u);
    EXPECT_FALSE(j.contains("access_token"));
}

TEST_F(SettingsTest, WrongTypesFallBackPerField) {
    write_file(R"({"poll_interval": "fast", "autostart": true, "theme": "neon"})");
    Settings s = load_settings(path_);
    EXPECT_EQ(s.poll_interval, kPollIntervalDefault);
    EXPECT_TRUE(s.autostart);
    EXPECT_EQ(s.theme, "auto");
}

TEST_F(SettingsTest, CorruptFileGivesDefaults) {
    write_file("poll_interval=60\n");
    Settings s = load_settings(path_);
    EXPECT_EQ(s.poll_interval, kPollIntervalDefault);
    EXPECT_FALSE(s.autostart);
}
