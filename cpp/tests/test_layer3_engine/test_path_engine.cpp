/**
 * @file test_path_engine.cpp
 * @brief Path-based construction: target selection, one instance per test,
 *        replayed outcomes and messages.
 */
#include "test_preamble.h"

#include <algorithm>

using namespace treespec;
using engine::EventType;
using engine::PathEngine;
using treespec::test::RecordingRun;
using Path = PathEngine::Path;

// ============================================================================
// is_in_target_path
// ============================================================================

TEST(PathTargetTest, WithoutTargetOnlyAllZeroPathsQualify)
{
    EXPECT_TRUE(PathEngine::is_in_target_path({0}, std::nullopt));
    EXPECT_TRUE(PathEngine::is_in_target_path({0, 0, 0}, std::nullopt));
    EXPECT_FALSE(PathEngine::is_in_target_path({0, 1}, std::nullopt));
    EXPECT_FALSE(PathEngine::is_in_target_path({1}, std::nullopt));
}

TEST(PathTargetTest, AncestorsOfTargetQualify)
{
    const std::optional<Path> target = Path{0, 2, 1};
    EXPECT_TRUE(PathEngine::is_in_target_path({0}, target));
    EXPECT_TRUE(PathEngine::is_in_target_path({0, 2}, target));
    EXPECT_FALSE(PathEngine::is_in_target_path({1}, target));
    EXPECT_FALSE(PathEngine::is_in_target_path({0, 1}, target));
}

TEST(PathTargetTest, TargetItselfQualifies)
{
    const std::optional<Path> target = Path{0, 2, 1};
    EXPECT_TRUE(PathEngine::is_in_target_path({0, 2, 1}, target));
    EXPECT_FALSE(PathEngine::is_in_target_path({0, 2, 0}, target));
}

TEST(PathTargetTest, FirstChildChainBelowTargetQualifies)
{
    const std::optional<Path> target = Path{1};
    EXPECT_TRUE(PathEngine::is_in_target_path({1, 0}, target));
    EXPECT_TRUE(PathEngine::is_in_target_path({1, 0, 0}, target));
    EXPECT_FALSE(PathEngine::is_in_target_path({1, 1}, target));
    EXPECT_FALSE(PathEngine::is_in_target_path({1, 0, 2}, target));
    EXPECT_FALSE(PathEngine::is_in_target_path({2, 0}, target));
}

// ============================================================================
// Specs used below
// ============================================================================

namespace
{

/// Records which bodies ran, across every instance of a spec.
struct Journal
{
    std::vector<std::string> entries;
    int instances{0};
};

class StackSpec : public styles::PathFunSpec
{
  public:
    StackSpec(std::shared_ptr<PathEngine> path_engine, Journal *journal)
        : PathFunSpec(std::move(path_engine), "StackSpec")
    {
        ++journal->instances;
        describe("A Stack",
                 [=, this]
                 {
                     it("starts empty",
                        [=, this]
                        {
                            journal->entries.push_back("starts empty");
                            if (!stack_.empty())
                                throw std::runtime_error("stack was not empty");
                        });
                     describe("after one push",
                              [=, this]
                              {
                                  stack_.push_back(7);
                                  it("has size one",
                                     [=, this]
                                     {
                                         journal->entries.push_back("has size one");
                                         if (stack_.size() != 1)
                                             throw std::runtime_error("size was not one");
                                     });
                                  it("pops the pushed value",
                                     [=, this]
                                     {
                                         journal->entries.push_back("pops the pushed value");
                                         if (stack_.back() != 7)
                                             throw std::runtime_error("wrong value");
                                         stack_.pop_back();
                                     });
                              });
                     it("is still empty afterwards",
                        [=, this]
                        {
                            journal->entries.push_back("is still empty afterwards");
                            if (!stack_.empty())
                                throw std::runtime_error("a sibling's push leaked");
                        });
                 });
    }

  private:
    std::vector<int> stack_;
};

} // namespace

// ============================================================================
// Construction passes
// ============================================================================

TEST(PathEngineTest, EachTestRunsOnceInItsOwnInstance)
{
    Journal journal;
    auto spec = styles::make_path_spec<StackSpec>(&journal);

    EXPECT_EQ(journal.entries, (std::vector<std::string>{"starts empty", "has size one", "pops the pushed value",
                                                         "is still empty afterwards"}));
    EXPECT_EQ(journal.instances, 4);
}

TEST(PathEngineTest, NamesAndTreeOrderMatchSourceOrder)
{
    Journal journal;
    auto spec = styles::make_path_spec<StackSpec>(&journal);

    EXPECT_EQ(spec->test_names(),
              (std::vector<std::string>{"A Stack starts empty", "A Stack after one push has size one",
                                        "A Stack after one push pops the pushed value",
                                        "A Stack is still empty afterwards"}));
    EXPECT_EQ(spec->test_path("A Stack after one push pops the pushed value"), (std::vector<int>{0, 1, 1}));
    EXPECT_EQ(spec->test_path("A Stack is still empty afterwards"), (std::vector<int>{0, 2}));
}

TEST(PathEngineTest, RunReplaysOutcomesWithoutRerunning)
{
    Journal journal;
    auto spec = styles::make_path_spec<StackSpec>(&journal);
    const size_t bodies_run = journal.entries.size();

    RecordingRun run;
    spec->run(std::nullopt, run.args);

    EXPECT_EQ(journal.entries.size(), bodies_run);
    EXPECT_EQ(run.reporter->count_of(EventType::TestSucceeded), 4u);
    EXPECT_EQ(run.reporter->count_of(EventType::TestFailed), 0u);
    EXPECT_EQ(run.reporter->types(),
              (std::vector<EventType>{EventType::ScopeOpened, EventType::TestStarting, EventType::TestSucceeded,
                                      EventType::ScopeOpened, EventType::TestStarting, EventType::TestSucceeded,
                                      EventType::TestStarting, EventType::TestSucceeded, EventType::ScopeClosed,
                                      EventType::TestStarting, EventType::TestSucceeded, EventType::ScopeClosed}));
}

namespace
{

class MixedSpec : public styles::PathFunSpec
{
  public:
    explicit MixedSpec(std::shared_ptr<PathEngine> path_engine) : PathFunSpec(std::move(path_engine), "MixedSpec")
    {
        info("before everything");
        describe("Outcomes",
                 [this]
                 {
                     it("fails", [] { throw std::runtime_error("boom"); });
                     it("is pending", [] { engine::pending(); });
                     it("is canceled", [] { engine::cancel("no fixture"); });
                     it("takes a while",
                        [this]
                        {
                            info("sleeping");
                            std::this_thread::sleep_for(std::chrono::milliseconds(20));
                        });
                     ignore("is ignored", [] {});
                     describe("with nothing inside", [] {});
                 });
    }
};

} // namespace

TEST(PathEngineTest, ReplayedOutcomesKeepTheirKind)
{
    auto spec = styles::make_path_spec<MixedSpec>();

    RecordingRun run;
    spec->run(std::nullopt, run.args);

    const auto failed = run.reporter->find(EventType::TestFailed, "Outcomes fails");
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->error_message, "boom");
    EXPECT_TRUE(run.reporter->find(EventType::TestPending, "Outcomes is pending").has_value());
    const auto canceled = run.reporter->find(EventType::TestCanceled, "Outcomes is canceled");
    ASSERT_TRUE(canceled.has_value());
    EXPECT_EQ(canceled->error_message, "no fixture");
    EXPECT_TRUE(run.reporter->find(EventType::TestIgnored, "Outcomes is ignored").has_value());
}

TEST(PathEngineTest, RecordedDurationIsReported)
{
    auto spec = styles::make_path_spec<MixedSpec>();

    RecordingRun run;
    spec->run(std::nullopt, run.args);

    const auto slow = run.reporter->find(EventType::TestSucceeded, "Outcomes takes a while");
    ASSERT_TRUE(slow.has_value());
    ASSERT_TRUE(slow->duration.has_value());
    EXPECT_GE(slow->duration->count(), 20);
}

TEST(PathEngineTest, InfoSentDuringConstructionTestIsReplayed)
{
    auto spec = styles::make_path_spec<MixedSpec>();

    RecordingRun run;
    spec->run(std::nullopt, run.args);

    const auto infos = run.reporter->events_of(EventType::InfoProvided);
    ASSERT_EQ(infos.size(), 2u);
    EXPECT_EQ(infos[0].text, "before everything");
    EXPECT_FALSE(infos[0].test_name.has_value());
    EXPECT_EQ(infos[1].text, "sleeping");
    EXPECT_EQ(infos[1].test_name, "Outcomes takes a while");
    EXPECT_EQ(infos[1].formatter->indentation_level, 2);

    // The replayed message follows its test's outcome.
    const auto events = run.reporter->events();
    auto outcome = std::find_if(events.begin(), events.end(), [](const engine::Event &e)
                                { return e.type == EventType::TestSucceeded && e.test_name == "Outcomes takes a while"; });
    ASSERT_NE(outcome, events.end());
    auto next = std::next(outcome);
    ASSERT_NE(next, events.end());
    EXPECT_EQ(next->type, EventType::InfoProvided);
}

TEST(PathEngineTest, EmptyDescribeStillRegistersItsScope)
{
    auto spec = styles::make_path_spec<MixedSpec>();

    RecordingRun run;
    spec->run(std::nullopt, run.args);

    const auto opened = run.reporter->events_of(EventType::ScopeOpened);
    ASSERT_EQ(opened.size(), 2u);
    EXPECT_EQ(opened[1].text, "with nothing inside");
}

namespace
{

class NestedItSpec : public styles::PathFunSpec
{
  public:
    explicit NestedItSpec(std::shared_ptr<PathEngine> path_engine)
        : PathFunSpec(std::move(path_engine), "NestedItSpec")
    {
        it("outer", [this] { it("inner", [] {}); });
        it("sibling", [] {});
    }
};

} // namespace

TEST(PathEngineTest, ItInsideItFailsTheOuterTest)
{
    auto spec = styles::make_path_spec<NestedItSpec>();
    EXPECT_EQ(spec->test_names(), (std::vector<std::string>{"outer", "sibling"}));

    RecordingRun run;
    spec->run(std::nullopt, run.args);

    const auto failed = run.reporter->find(EventType::TestFailed, "outer");
    ASSERT_TRUE(failed.has_value());
    EXPECT_NE(failed->error_message.find("may not appear inside"), std::string::npos);
    EXPECT_TRUE(run.reporter->find(EventType::TestSucceeded, "sibling").has_value());
}

TEST(PathEngineTest, PassCountAndIdempotentCompletion)
{
    auto path_engine = styles::make_path_engine();
    Journal journal;
    auto first = std::make_unique<StackSpec>(path_engine, &journal);
    EXPECT_EQ(path_engine->passes(), 1);

    int extra = 0;
    path_engine->ensure_test_results_registered(
        [&]
        {
            ++extra;
            StackSpec again(path_engine, &journal);
        });
    EXPECT_EQ(extra, 3);
    EXPECT_EQ(path_engine->passes(), 4);

    path_engine->ensure_test_results_registered([&] { ++extra; });
    EXPECT_EQ(extra, 3);
}

TEST(PathEngineTest, InfoAfterRunIsRejected)
{
    auto path_engine = styles::make_path_engine();
    Journal journal;
    auto spec = std::make_unique<StackSpec>(path_engine, &journal);
    path_engine->ensure_test_results_registered([&] { StackSpec again(path_engine, &journal); });

    RecordingRun run;
    spec->run(std::nullopt, run.args);

    EXPECT_THROW(path_engine->handle_info("too late", std::nullopt), engine::InformerClosedError);
}

namespace
{

class ThreadedSpec : public styles::PathFunSpec
{
  public:
    explicit ThreadedSpec(std::shared_ptr<PathEngine> path_engine) : PathFunSpec(std::move(path_engine), "ThreadedSpec")
    {
        it("first",
           [this]
           {
               std::thread worker([this] { info("from worker"); });
               worker.join();
           });
        it("second", [] {});
    }
};

class WorkerNestingSpec : public styles::PathFunSpec
{
  public:
    explicit WorkerNestingSpec(std::shared_ptr<PathEngine> path_engine)
        : PathFunSpec(std::move(path_engine), "WorkerNestingSpec")
    {
        it("spawns",
           [this]
           {
               std::exception_ptr worker_error;
               std::thread worker(
                   [&]
                   {
                       try
                       {
                           it("from worker", [] {});
                       }
                       catch (...)
                       {
                           worker_error = std::current_exception();
                       }
                   });
               worker.join();
               if (worker_error)
               {
                   std::rethrow_exception(worker_error);
               }
           });
        it("after", [] {});
    }
};

} // namespace

TEST(PathEngineTest, WorkerThreadInfoDoesNotTakeAPathSlot)
{
    auto spec = styles::make_path_spec<ThreadedSpec>();
    EXPECT_EQ(spec->test_names(), (std::vector<std::string>{"first", "second"}));
}

TEST(PathEngineTest, WorkerThreadInfoIsReplayedAfterTheOutcome)
{
    auto spec = styles::make_path_spec<ThreadedSpec>();

    RecordingRun run;
    spec->run(std::nullopt, run.args);

    const auto events = run.reporter->events();
    auto outcome = std::find_if(events.begin(), events.end(), [](const engine::Event &e)
                                { return e.type == EventType::TestSucceeded && e.test_name == "first"; });
    ASSERT_NE(outcome, events.end());
    auto next = std::next(outcome);
    ASSERT_NE(next, events.end());
    EXPECT_EQ(next->type, EventType::InfoProvided);
    EXPECT_EQ(next->text, "from worker");
    EXPECT_EQ(next->test_name, "first");
    EXPECT_FALSE(next->from_constructing_thread);

    EXPECT_TRUE(run.reporter->find(EventType::TestSucceeded, "second").has_value());
}

TEST(PathEngineTest, ItFromAWorkerThreadFailsTheRunningTest)
{
    auto spec = styles::make_path_spec<WorkerNestingSpec>();
    EXPECT_EQ(spec->test_names(), (std::vector<std::string>{"spawns", "after"}));

    RecordingRun run;
    spec->run(std::nullopt, run.args);

    const auto failed = run.reporter->find(EventType::TestFailed, "spawns");
    ASSERT_TRUE(failed.has_value());
    EXPECT_NE(failed->error_message.find("may not appear inside"), std::string::npos);
    EXPECT_TRUE(run.reporter->find(EventType::TestSucceeded, "after").has_value());
}
