/**
 * @file path_spec_example.cpp
 * @brief Example: a PathFunSpec, where every test runs in its own instance
 *        of the suite while the suite is being constructed.
 *
 * Members initialised by the enclosing `describe` bodies are seen fresh by
 * each test, so tests can mutate them without tidying up after themselves.
 * Running the suite afterwards replays the recorded outcomes.
 */
#include "tsp_engine.hpp"

#include <fmt/format.h>

#include <map>
#include <stdexcept>
#include <string>

using namespace treespec;

class AccountSpec : public styles::PathFunSpec
{
  public:
    explicit AccountSpec(std::shared_ptr<engine::PathEngine> path_engine)
        : PathFunSpec(std::move(path_engine), "AccountSpec")
    {
        describe("An account",
                 [this]
                 {
                     balances_["alice"] = 100;

                     it("starts with the opening balance", [this] { check(balances_["alice"] == 100); });

                     describe("after a withdrawal",
                              [this]
                              {
                                  balances_["alice"] -= 30;

                                  it("is debited", [this] { check(balances_["alice"] == 70); });
                                  it("can be emptied",
                                     [this]
                                     {
                                         balances_["alice"] -= 70;
                                         info("balance now zero");
                                         check(balances_["alice"] == 0);
                                     });
                              });

                     it("is unaffected by the other tests", [this] { check(balances_["alice"] == 100); });
                 });
    }

  private:
    static void check(bool condition)
    {
        if (!condition)
            throw std::runtime_error("balance check failed");
    }

    std::map<std::string, int> balances_;
};

int main()
{
    auto spec = styles::make_path_spec<AccountSpec>();

    auto reporter = std::make_shared<engine::ConsoleReporter>();
    const bool completed = engine::run_suite(*spec, engine::RunArgs::with_reporter(reporter));

    fmt::print("{}\n", reporter->summary());
    return completed && reporter->counts().failed == 0 ? 0 : 1;
}
