#include <gtest/gtest.h>
#include "config.hpp"
#include "errors.hpp"
#include "temp_dir.hpp"

TEST(ConfigTest, MissingKeysKeepDefaults) {
    Config config = Config::fromJson(nlohmann::json::parse(R"({"languages": ["en"], "multi": true})"));
    EXPECT_EQ(config.languages, (std::vector<std::string>{"en"}));
    EXPECT_TRUE(config.multi);
    EXPECT_FALSE(config.force);
    EXPECT_EQ(config.workers, 4);
    EXPECT_EQ(config.max_depth, 3);
    EXPECT_EQ(config.sort_order, (std::vector<std::string>{"language", "provider", "provider_confidence"}));
    EXPECT_TRUE(config.filemode.empty());
}

TEST(ConfigTest, WrongTypeIsReported) {
    EXPECT_THROW(Config::fromJson(nlohmann::json::parse(R"({"workers": "many"})")), SubscoutError);
}

TEST(ConfigTest, ConvertsToSchedulerOptions) {
    Config config;
    config.languages = {"fr"};
    config.workers = 2;
    config.sort_order = {"matching_confidence", "language"};
    config.filemode = "644";
    config.opensubtitles_api_key = "key";

    SchedulerOptions options = config.toSchedulerOptions();
    EXPECT_EQ(options.languages, (std::vector<std::string>{"fr"}));
    EXPECT_EQ(options.workers, 2u);
    EXPECT_EQ(options.sort_order,
              (std::vector<RankCriterion>{RankCriterion::ContentMatchConfidence, RankCriterion::LanguageRank}));
    ASSERT_TRUE(options.filemode.has_value());
    EXPECT_EQ(*options.filemode, 0644u);
    EXPECT_EQ(options.api_key, "key");
}

TEST(ConfigTest, RejectsInvalidValues) {
    Config bad_mode;
    bad_mode.filemode = "rw-r--r--";
    EXPECT_THROW(bad_mode.toSchedulerOptions(), SubscoutError);

    Config octal_overflow;
    octal_overflow.filemode = "17777";
    EXPECT_THROW(octal_overflow.toSchedulerOptions(), SubscoutError);

    Config bad_criterion;
    bad_criterion.sort_order = {"popularity"};
    EXPECT_THROW(bad_criterion.toSchedulerOptions(), SubscoutError);

    Config no_workers;
    no_workers.workers = 0;
    EXPECT_THROW(no_workers.toSchedulerOptions(), SubscoutError);
}

TEST(ConfigTest, SavesAndLoads) {
    TempDir dir;
    std::string path = (dir.path() / "nested" / "config.json").string();

    Config config;
    config.providers = {"OpenSubtitles"};
    config.max_depth = 0;
    config.cache_dir = "/var/cache/subscout";
    config.save(path);

    Config loaded = Config::load(path);
    EXPECT_EQ(loaded.providers, config.providers);
    EXPECT_EQ(loaded.max_depth, 0);
    EXPECT_EQ(loaded.cache_dir, "/var/cache/subscout");
}

TEST(ConfigTest, CorruptFileIsReported) {
    TempDir dir;
    std::string path = dir.touch("config.json");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(Config::load(path), SubscoutError);
}
