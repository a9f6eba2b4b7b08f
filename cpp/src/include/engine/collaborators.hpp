#pragma once
/**
 * @file collaborators.hpp
 * @brief The objects a run is carried out with: where events go (Reporter),
 *        how they are ordered (Tracker), when to stop (Stopper), and the
 *        configuration handed to tests (ConfigMap).
 */
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

#include <nlohmann/json.hpp>

#include "engine/events.hpp"
#include "engine/filter.hpp"
#include "treespec_export.h"

namespace treespec::engine
{

class Suite;

/// Free-form configuration passed through every run call to the tests. Must be a JSON object.
using ConfigMap = nlohmann::json;

/// Polled between tree nodes; returning true stops entering further nodes.
using Stopper = std::function<bool()>;

/**
 * @brief Receives the ordered events of a run. May be called from any thread
 *        that sends info or markup while a test is running.
 */
class TREESPEC_EXPORT Reporter
{
  public:
    virtual ~Reporter() = default;
    virtual void apply(const Event &event) = 0;
};

/**
 * @brief Hands out increasing ordinals. Thread-safe.
 */
class TREESPEC_EXPORT Tracker
{
  public:
    explicit Tracker(int64_t run_stamp = 0) noexcept : run_stamp_(run_stamp) {}

    Tracker(const Tracker &) = delete;
    Tracker &operator=(const Tracker &) = delete;

    Ordinal next_ordinal() noexcept
    {
        return Ordinal{run_stamp_, next_sequence_.fetch_add(1, std::memory_order_relaxed)};
    }

  private:
    int64_t run_stamp_;
    std::atomic<int64_t> next_sequence_{0};
};

/**
 * @brief Lets a runner execute suites elsewhere. The engine only carries it
 *        through to the suite's own run hook.
 */
class TREESPEC_EXPORT Distributor
{
  public:
    virtual ~Distributor() = default;
    virtual void apply(Suite &suite, const std::shared_ptr<Tracker> &tracker) = 0;
};

/**
 * @brief Everything `run`, `run_tests` and `run_test` are invoked with.
 */
struct TREESPEC_EXPORT RunArgs
{
    std::shared_ptr<Reporter> reporter;
    Stopper stopper = [] { return false; };
    Filter filter;
    ConfigMap config_map = ConfigMap::object();
    std::shared_ptr<Distributor> distributor; ///< optional
    std::shared_ptr<Tracker> tracker = std::make_shared<Tracker>();

    /**
     * @brief Fails with NullArgumentError naming the first missing argument:
     *        reporter, stopper, config_map (null JSON), tracker.
     */
    void require_non_null() const;

    /// A RunArgs with default stopper, filter and config map, and a fresh tracker.
    static RunArgs with_reporter(std::shared_ptr<Reporter> reporter);
};

} // namespace treespec::engine
