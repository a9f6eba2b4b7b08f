#pragma once
/**
 * @file path_engine.hpp
 * @brief Engine for styles whose test bodies run while the suite is being
 *        constructed.
 *
 * Every node met during construction gets a path: the child indices from
 * the trunk down to it. Construction is repeated once per pass, each pass
 * aiming at one target path. Only the node on the target path is executed
 * or registered; the first unvisited node met after it becomes the next
 * pass's target. The passes stop when a pass finds no new target.
 *
 * A test that runs during a pass is registered with a body that replays the
 * observed outcome, together with its measured duration and the messages it
 * sent, so the later `run` reports it without executing it again.
 *
 * Driving the passes:
 * @code
 * auto spec = make_path_spec<MyPathSpec>();   // see styles/path_fun_spec.hpp
 * @endcode
 * which amounts to
 * @code
 * auto engine = std::make_shared<PathEngine>(...);
 * auto first = std::make_unique<MyPathSpec>(engine);   // first pass
 * engine->ensure_test_results_registered([&] { MyPathSpec again(engine); });
 * @endcode
 */
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "engine/super_engine.hpp"
#include "treespec_export.h"

namespace treespec::engine
{

class TREESPEC_EXPORT PathEngine : public Engine
{
  public:
    using Path = std::vector<int>;

    PathEngine(std::string concurrent_bundle_mod_message, std::string simple_class_name);

    /**
     * @brief Handles a `describe`: enters the branch when it lies on the
     *        target path, registering it the first time it is reached.
     * @throws RegistrationClosedError when called while a test body runs,
     *         from the body's thread or any other.
     */
    void handle_nested_branch(const std::string &description, const std::optional<std::string> &child_prefix,
                              const std::function<void()> &body, const std::string &registration_closed_message,
                              const std::optional<LineInFile> &location);

    /**
     * @brief Handles an `it`: runs and registers the test when it is the target.
     * @throws RegistrationClosedError when called from inside a test body.
     */
    void handle_test(const std::string &test_text, const std::function<void()> &test_fun,
                     const std::string &registration_closed_message, const std::optional<LineInFile> &location,
                     const std::set<std::string> &test_tags = {});

    /**
     * @brief Handles an `ignore`: registers the test as ignored, without
     *        running it, when it is the target.
     * @throws RegistrationClosedError when called from inside a test body.
     */
    void handle_ignored_test(const std::string &test_text, const std::function<void()> &test_fun,
                             const std::string &registration_closed_message,
                             const std::optional<LineInFile> &location, const std::set<std::string> &test_tags = {});

    /// Inside a test (from any thread) or after construction: goes to the
    /// current sink. Otherwise a path leaf.
    void handle_info(const std::string &message, const std::optional<LineInFile> &location);
    void handle_markup(const std::string &message, const std::optional<LineInFile> &location);

    /**
     * @brief Runs @p construct once per remaining target, after the first
     *        construction pass has happened. Later calls return immediately.
     */
    void ensure_test_results_registered(const std::function<void()> &construct);

    /**
     * @brief Whether @p candidate lies on the way to, at, or along the first
     *        child chain below @p target. With no target, only all-zero paths do.
     */
    static bool is_in_target_path(const Path &candidate, const std::optional<Path> &target);

    /// Number of construction passes seen so far, the first one included.
    int passes() const noexcept { return passes_; }

  private:
    Path take_next_path();
    bool inside_test() const noexcept;
    void handle_message_leaf(MessageKind kind, const std::string &message,
                             const std::optional<LineInFile> &location);
    void reset_pass_state(std::optional<Path> target);

    std::mutex passes_mutex_;
    // Set while a test body runs. Checked from any thread: workers started by
    // the body must reach the test's sinks, not the path bookkeeping.
    std::atomic<bool> test_running_{false};
    bool results_registered_{false};
    int passes_{1};

    // Per-pass state.
    std::optional<Path> target_path_;
    std::optional<Path> next_target_path_;
    Path current_path_;
    std::set<Path> used_paths_;
    bool target_leaf_reached_{false};
    int leaves_encountered_{0};

    // Survives across passes: branches registered so far, by path.
    std::map<Path, Branch *> registered_branches_;
};

} // namespace treespec::engine
