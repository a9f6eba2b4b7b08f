/**
 * @file stack_spec_example.cpp
 * @brief Example: a FunSpec and a WordSpec for a small stack, run through
 *        the console reporter.
 *
 * Usage:
 *   stack_spec_example [run_config.json]
 *
 * Key concepts shown:
 *  - Registering nested `describe` / `it` clauses in a suite's constructor.
 *  - `info` inside a test: reported after the test's outcome.
 *  - `pending()` and `ignore` for tests that are not ready.
 *  - Tag filtering, `stop_on_failure` and logging driven by a JSON RunConfig.
 */
#include "tsp_engine.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <vector>

using namespace treespec;

// ─── Code under test ─────────────────────────────────────────────────────────

class IntStack
{
  public:
    void push(int v) { items_.push_back(v); }

    int pop()
    {
        if (items_.empty())
            throw std::out_of_range("pop on empty stack");
        const int v = items_.back();
        items_.pop_back();
        return v;
    }

    bool empty() const noexcept { return items_.empty(); }
    size_t size() const noexcept { return items_.size(); }

  private:
    std::vector<int> items_;
};

#define EXPECT_OR_THROW(cond)                                                                                       \
    do                                                                                                             \
    {                                                                                                              \
        if (!(cond))                                                                                               \
            throw std::runtime_error("expectation failed: " #cond);                                                \
    } while (0)

// ─── Suites ──────────────────────────────────────────────────────────────────

class StackFunSpec : public styles::FunSpec
{
  public:
    StackFunSpec() : FunSpec("StackFunSpec")
    {
        describe("A Stack",
                 [this]
                 {
                     it("pops values in last-in-first-out order",
                        [this]
                        {
                            IntStack s;
                            s.push(1);
                            s.push(2);
                            info("pushed 1 and 2");
                            EXPECT_OR_THROW(s.pop() == 2);
                            EXPECT_OR_THROW(s.pop() == 1);
                        });

                     describe("when empty",
                              [this]
                              {
                                  it("throws on pop",
                                     []
                                     {
                                         IntStack s;
                                         bool threw = false;
                                         try
                                         {
                                             (void)s.pop();
                                         }
                                         catch (const std::out_of_range &)
                                         {
                                             threw = true;
                                         }
                                         EXPECT_OR_THROW(threw);
                                     });
                                  it("reports its capacity", {"slow"}, [] { engine::pending(); });
                              });

                     ignore("grows without bound", [] {});
                 });
    }
};

class StackWordSpec : public styles::WordSpec
{
  public:
    StackWordSpec() : WordSpec("StackWordSpec")
    {
        when("A Stack",
             [this]
             {
                 should("empty",
                        [this]
                        {
                            in("have size 0", [] { EXPECT_OR_THROW(IntStack{}.size() == 0); });
                        });
                 should("full", [this] { in("refuse to push", [] { engine::pending(); }); });
             });
    }
};

// ─── Driver ──────────────────────────────────────────────────────────────────

int main(int argc, char **argv)
{
    engine::RunConfig config;
    try
    {
        if (argc > 1)
            config = engine::RunConfig::from_json_file(argv[1]);
        config.apply_logging();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "{}\n", e.what());
        return 2;
    }

    auto reporter = std::make_shared<engine::ConsoleReporter>();
    auto args = engine::RunArgs::with_reporter(reporter);
    args.filter = config.make_filter();
    args.config_map = config.config_map;
    if (config.stop_on_failure)
    {
        args.stopper = [reporter] { return reporter->counts().failed > 0; };
    }

    StackFunSpec fun_spec;
    StackWordSpec word_spec;

    bool completed = true;
    completed = engine::run_suite(fun_spec, args) && completed;
    completed = engine::run_suite(word_spec, args) && completed;

    fmt::print("{}\n", reporter->summary());
    return completed && reporter->counts().failed == 0 ? 0 : 1;
}
