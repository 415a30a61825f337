#include <gtest/gtest.h>
#include <memory>
#include "fake_provider.hpp"
#include "worker.hpp"

class WorkerPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        good = std::make_shared<FakeBehavior>();
        good->listing = {makeSubtitle("en", 0.9, "good.en"), makeSubtitle("fr", 0.8, "good.fr")};
        bad = std::make_shared<FakeBehavior>();
        bad->list_throws = true;

        registry.add(fakeEntry("Good", good));
        registry.add(fakeEntry("Bad", bad));
        video = Video::fromPath("/videos/The.Office.S02E03.720p.HDTV.x264-LOL.mkv");
    }

    std::unique_ptr<WorkerPool> makePool(size_t workers) {
        return std::make_unique<WorkerPool>(workers, queue, list_results, download_results, registry,
                                            ProviderConfig());
    }

    ListTask listTask(const std::string& provider, std::set<std::string> languages = {"en"}) {
        return ListTask{video, std::move(languages), provider, ProviderConfig()};
    }

    Subtitle candidate(const std::string& provider, const std::string& release) {
        Subtitle subtitle = makeSubtitle("en", 0.5, release);
        subtitle.video = video;
        subtitle.provider = provider;
        return subtitle;
    }

    std::shared_ptr<FakeBehavior> good;
    std::shared_ptr<FakeBehavior> bad;
    ProviderRegistry registry;
    VideoPtr video;
    TaskQueue queue;
    ResultChannel<ListResult> list_results;
    ResultChannel<DownloadResult> download_results;
};

TEST_F(WorkerPoolTest, ListTaskPublishesVideoAndSubtitles) {
    auto pool = makePool(2);
    pool->start();
    queue.push(TaskQueue::PRIORITY_NORMAL, listTask("Good", {"en"}));

    ListResult result = list_results.pop();
    pool->stop(TaskQueue::PRIORITY_DRAIN);

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].first->path, video->path);
    ASSERT_EQ(result[0].second.size(), 1u);
    EXPECT_EQ(result[0].second[0].language, "en");
    EXPECT_EQ(result[0].second[0].provider, "Good");
}

TEST_F(WorkerPoolTest, ProviderFailureYieldsEmptyResultAndWorkerSurvives) {
    auto pool = makePool(1);
    pool->start();
    queue.push(TaskQueue::PRIORITY_NORMAL, listTask("Bad"));
    queue.push(TaskQueue::PRIORITY_NORMAL, listTask("Good"));

    ListResult first = list_results.pop();
    ListResult second = list_results.pop();
    pool->stop(TaskQueue::PRIORITY_DRAIN);

    EXPECT_TRUE(first.empty());
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(bad->list_calls, 1);
    EXPECT_EQ(good->list_calls, 1);
}

TEST_F(WorkerPoolTest, UnknownProviderIsContained) {
    auto pool = makePool(1);
    pool->start();
    queue.push(TaskQueue::PRIORITY_NORMAL, listTask("Missing"));

    EXPECT_TRUE(list_results.pop().empty());
    pool->stop(TaskQueue::PRIORITY_DRAIN);
}

TEST_F(WorkerPoolTest, OneResultPerTaskWhateverTheOutcome) {
    auto pool = makePool(3);
    pool->start();
    const int tasks = 20;
    for (int i = 0; i < tasks; ++i) {
        queue.push(TaskQueue::PRIORITY_NORMAL, listTask(i % 3 == 0 ? "Bad" : "Good"));
    }

    int empty = 0;
    for (int i = 0; i < tasks; ++i) {
        if (list_results.pop().empty()) {
            ++empty;
        }
    }
    pool->stop(TaskQueue::PRIORITY_DRAIN);

    EXPECT_EQ(empty, 7);
    EXPECT_EQ(list_results.size(), 0u);
    EXPECT_EQ(good->list_calls + bad->list_calls, tasks);
}

TEST_F(WorkerPoolTest, DownloadFallsBackToNextCandidate) {
    good->failing_downloads = {"Good:first"};
    auto pool = makePool(1);
    pool->start();
    queue.push(TaskQueue::PRIORITY_NORMAL,
               DownloadTask{{candidate("Good", "first"), candidate("Good", "second"), candidate("Good", "third")}});

    DownloadResult result = download_results.pop();
    pool->stop(TaskQueue::PRIORITY_DRAIN);

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].release, "second");
    EXPECT_EQ(good->download_attempts, (std::vector<std::string>{"Good:first", "Good:second"}));
}

TEST_F(WorkerPoolTest, FirstSuccessfulCandidateWins) {
    auto pool = makePool(1);
    pool->start();
    queue.push(TaskQueue::PRIORITY_NORMAL, DownloadTask{{candidate("Good", "first"), candidate("Good", "second")}});

    DownloadResult result = download_results.pop();
    pool->stop(TaskQueue::PRIORITY_DRAIN);

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].release, "first");
    EXPECT_EQ(good->download_attempts, (std::vector<std::string>{"Good:first"}));
}

TEST_F(WorkerPoolTest, ExhaustedCandidatesPublishEmptyResult) {
    good->failing_downloads = {"Good:first", "Good:second"};
    auto pool = makePool(1);
    pool->start();
    queue.push(TaskQueue::PRIORITY_NORMAL, DownloadTask{{candidate("Good", "first"), candidate("Good", "second")}});

    DownloadResult result = download_results.pop();
    pool->stop(TaskQueue::PRIORITY_DRAIN);

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(good->download_attempts.size(), 2u);
}

TEST_F(WorkerPoolTest, UnexpectedDownloadErrorAbortsTheTask) {
    good->broken_downloads = {"Good:first"};
    auto pool = makePool(1);
    pool->start();
    queue.push(TaskQueue::PRIORITY_NORMAL, DownloadTask{{candidate("Good", "first"), candidate("Good", "second")}});

    DownloadResult result = download_results.pop();
    pool->stop(TaskQueue::PRIORITY_DRAIN);

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(good->download_attempts, (std::vector<std::string>{"Good:first"}));
}

TEST_F(WorkerPoolTest, ScratchPersistsAcrossTasksOfOneWorker) {
    auto pool = makePool(1);
    pool->start();
    for (int i = 0; i < 3; ++i) {
        queue.push(TaskQueue::PRIORITY_NORMAL, listTask("Good"));
    }
    for (int i = 0; i < 3; ++i) {
        list_results.pop();
    }
    pool->stop(TaskQueue::PRIORITY_DRAIN);

    EXPECT_EQ(good->scratch_counts, (std::vector<int>{1, 2, 3}));
}

TEST_F(WorkerPoolTest, DrainStopRunsQueuedWorkFirst) {
    for (int i = 0; i < 5; ++i) {
        queue.push(TaskQueue::PRIORITY_NORMAL, listTask("Good"));
    }
    auto pool = makePool(2);
    pool->start();
    pool->stop(TaskQueue::PRIORITY_DRAIN);

    EXPECT_FALSE(pool->running());
    EXPECT_EQ(good->list_calls, 5);
    EXPECT_EQ(list_results.size(), 5u);
    EXPECT_TRUE(queue.empty());
}

TEST_F(WorkerPoolTest, InterruptStopLeavesQueuedWork) {
    good->gated = true;
    for (int i = 0; i < 5; ++i) {
        queue.push(TaskQueue::PRIORITY_NORMAL, listTask("Good"));
    }
    auto pool = makePool(1);
    pool->start();
    good->waitEntered(1);

    std::thread stopper([&] { pool->stop(TaskQueue::PRIORITY_INTERRUPT); });
    while (queue.size() < 5) {
        std::this_thread::yield();
    }
    good->openGate();
    stopper.join();

    EXPECT_EQ(good->list_calls, 1);
    EXPECT_EQ(list_results.size(), 1u);
    EXPECT_EQ(queue.pendingWork(), 4u);
    EXPECT_EQ(queue.size(), 4u);
}
