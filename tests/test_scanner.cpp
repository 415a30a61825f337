#include <gtest/gtest.h>
#include <algorithm>
#include "scanner.hpp"
#include "temp_dir.hpp"

namespace {
    std::vector<std::string> filenames(const std::vector<ScanEntry>& entries) {
        std::vector<std::string> names;
        for (const auto& entry : entries) {
            names.push_back(std::filesystem::path(entry.path).filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }
}

TEST(NeedsSearchTest, ForceReturnsEverythingWanted) {
    std::set<std::string> wanted = {"en", "fr"};
    EXPECT_EQ(scanner::needsSearch({"en", "fr"}, true, wanted, true, true), wanted);
    EXPECT_EQ(scanner::needsSearch({"en"}, true, wanted, false, true), wanted);
}

TEST(NeedsSearchTest, MultiModeSkipsLanguagesOnDisk) {
    EXPECT_EQ(scanner::needsSearch({"en"}, false, {"en", "fr"}, true, false), (std::set<std::string>{"fr"}));
    EXPECT_TRUE(scanner::needsSearch({"en", "fr"}, false, {"en", "fr"}, true, false).empty());
}

TEST(NeedsSearchTest, MultiModeIgnoresUnlabeledSubtitle) {
    EXPECT_EQ(scanner::needsSearch({}, true, {"en"}, true, false), (std::set<std::string>{"en"}));
}

TEST(NeedsSearchTest, SingleModeStopsAtAnyUnlabeledSubtitle) {
    EXPECT_TRUE(scanner::needsSearch({}, true, {"en", "fr", "de"}, false, false).empty());
    EXPECT_EQ(scanner::needsSearch({"en"}, false, {"en", "fr"}, false, false), (std::set<std::string>{"en", "fr"}));
}

TEST(ScanTest, DetectsExistingSubtitles) {
    TempDir dir;
    std::string video = dir.touch("Movie.2010.mkv");
    dir.touch("Movie.2010.srt");
    dir.touch("Movie.2010.en.srt");
    dir.touch("Movie.2010.fr.ass");
    dir.touch("Movie.2010.xx.srt");
    dir.touch("Movie.2010.nfo");
    dir.touch("Movie.2010.Extended.mkv");

    auto entries = scanner::scan(video);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].path, video);
    EXPECT_TRUE(entries[0].has_single);
    EXPECT_EQ(entries[0].languages, (std::set<std::string>{"en", "fr"}));
}

TEST(ScanTest, VideoWithoutSubtitles) {
    TempDir dir;
    std::string video = dir.touch("Show.S01E01.avi");

    auto entries = scanner::scan(video);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_FALSE(entries[0].has_single);
    EXPECT_TRUE(entries[0].languages.empty());
}

TEST(ScanTest, TrustsTheEntryButFiltersRecursedFiles) {
    TempDir dir;
    std::string notes = dir.touch("notes.txt");
    dir.touch("Show.S01E01.mkv");
    dir.touch("cover.jpg");

    EXPECT_EQ(scanner::scan(notes).size(), 1u);
    EXPECT_EQ(filenames(scanner::scan(dir.path().string())), (std::vector<std::string>{"Show.S01E01.mkv"}));
}

TEST(ScanTest, RespectsMaximumDepth) {
    TempDir dir;
    dir.touch("a/top.mkv");
    dir.touch("a/b/middle.mkv");
    dir.touch("a/b/c/deep.mkv");

    EXPECT_EQ(filenames(scanner::scan(dir.path().string(), 3)),
              (std::vector<std::string>{"middle.mkv", "top.mkv"}));
    EXPECT_EQ(filenames(scanner::scan(dir.path().string(), 2)), (std::vector<std::string>{"top.mkv"}));
    EXPECT_EQ(filenames(scanner::scan(dir.path().string(), 0)),
              (std::vector<std::string>{"deep.mkv", "middle.mkv", "top.mkv"}));
}

TEST(ScanTest, MissingEntryYieldsNothing) {
    EXPECT_TRUE(scanner::scan("/nonexistent/path/video.mkv").empty());
}
