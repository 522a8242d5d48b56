// tests/test_layer3_repair/test_repair_concurrency.cpp
/**
 * @file test_repair_concurrency.cpp
 * @brief Concurrent repair runs: serialized on one path, parallel across paths.
 */

#include "sfx_repair.hpp"
#include "shared_test_helpers.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace fs = std::filesystem;
using namespace scenefix::repair;
using namespace scenefix::tests::helper;
using namespace std::chrono_literals;
using scenefix::utils::Logger;

namespace
{

constexpr const char *kDuplicates = R"(- id: x
  name: First
  entities:
    light.a: {state: 'on', effect: ~}
- id: x
  name: Second
  entities:
    light.b: {state: 'off'}
)";

// Holds every write until @c expected writers are inside write() at once, or a timeout.
class RendezvousStore : public DocumentStore
{
  public:
    RendezvousStore(Logger &logger, int expected) : DocumentStore(logger), expected_(expected) {}

    RepairStatus write(const fs::path &path, const SceneDocument &doc) override
    {
        {
            std::unique_lock<std::mutex> lock(mtx_);
            ++inside_;
            cv_.notify_all();
            if (cv_.wait_for(lock, 5s, [this] { return inside_ >= expected_; }))
                met_ = true;
        }
        return DocumentStore::write(path, doc);
    }

    bool met() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return met_;
    }

  private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    const int expected_;
    int inside_{0};
    bool met_{false};
};

} // namespace

class RepairConcurrencyTest : public ::testing::Test
{
  protected:
    TempDir dir_{"scenefix_concurrency"};
    Logger logger_;
    DocumentStore store_{logger_};
    BackupManager backups_{logger_};

    void SetUp() override { ASSERT_TRUE(logger_.set_logfile((dir_ / "repair.log").string())); }

    fs::path Scenes(const std::string &name, std::string_view text)
    {
        const fs::path path = dir_ / name;
        if (!write_file_contents(path, text))
            throw std::runtime_error("cannot write " + path.string());
        return path;
    }
};

TEST_F(RepairConcurrencyTest, RunsOnOnePathAreSerialized)
{
    const fs::path path = Scenes("scenes.yaml", kDuplicates);
    RepairPipeline pipeline(logger_, store_, backups_);

    const int threads = 4;
    std::vector<RepairOutcome> outcomes(threads);
    ThreadRacer racer(threads);
    ASSERT_TRUE(racer.race([&](int id)
                           { outcomes[id] = pipeline.repair(path, DefectClass::DuplicateIds); }));

    const auto committed = std::count_if(outcomes.begin(), outcomes.end(), [](const auto &o)
                                         { return o.state == RepairState::Committed; });
    const auto done = std::count_if(outcomes.begin(), outcomes.end(),
                                    [](const auto &o) { return o.state == RepairState::Done; });
    EXPECT_EQ(committed, 1);
    EXPECT_EQ(done, threads - 1);
    EXPECT_EQ(backups_.list_backups(path).size(), 1u);

    auto loaded = store_.load(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.detail();
    EXPECT_TRUE(find_duplicate_ids(loaded.content()).empty());
}

TEST_F(RepairConcurrencyTest, DifferentDefectClassesOnOnePathBothApply)
{
    const fs::path path = Scenes("scenes.yaml", kDuplicates);
    RepairPipeline pipeline(logger_, store_, backups_);

    std::vector<RepairOutcome> outcomes(2);
    ThreadRacer racer(2);
    ASSERT_TRUE(racer.race(
        [&](int id)
        {
            outcomes[id] = pipeline.repair(
                path, id == 0 ? DefectClass::DuplicateIds : DefectClass::EmptyAttributes);
        }));

    EXPECT_EQ(outcomes[0].state, RepairState::Committed);
    EXPECT_EQ(outcomes[1].state, RepairState::Committed);

    auto loaded = store_.load(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.detail();
    EXPECT_TRUE(find_duplicate_ids(loaded.content()).empty());
    EXPECT_TRUE(find_empty_attributes(loaded.content()).empty());
}

TEST_F(RepairConcurrencyTest, RunsOnDifferentPathsProceedInParallel)
{
    const int threads = 3;
    std::vector<fs::path> paths;
    for (int i = 0; i < threads; ++i)
        paths.push_back(Scenes(fmt::format("scenes_{}.yaml", i), kDuplicates));

    RendezvousStore store(logger_, threads);
    RepairPipeline pipeline(logger_, store, backups_);

    std::vector<std::future<RepairOutcome>> futures;
    for (const auto &path : paths)
        futures.push_back(pipeline.repair_async(path, DefectClass::DuplicateIds));
    for (auto &f : futures)
        EXPECT_EQ(f.get().state, RepairState::Committed);

    EXPECT_TRUE(store.met()) << "writers on different paths never overlapped";
}

TEST_F(RepairConcurrencyTest, AsyncCancellationBeforeStartAborts)
{
    const fs::path path = Scenes("scenes.yaml", kDuplicates);
    RepairPipeline pipeline(logger_, store_, backups_);

    auto token = std::make_shared<CancellationToken>();
    token->cancel();
    const RepairOutcome outcome =
        pipeline.repair_async(path, DefectClass::DuplicateIds, token).get();
    EXPECT_EQ(outcome.state, RepairState::Aborted);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, RepairErrc::Cancelled);

    std::string bytes;
    ASSERT_TRUE(read_file_contents(path.string(), bytes));
    EXPECT_EQ(bytes, kDuplicates);
}
