#include "engine/path_engine.hpp"

#include <algorithm>
#include <memory>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "engine/cleanup_guard.hpp"
#include "tsp_platform.hpp"
#include "utils/logger.hpp"

namespace treespec::engine
{

namespace
{
constexpr const char *kItInsideIt = "An it clause may not appear inside another it or they clause.";
constexpr const char *kIgnoreInsideIt = "An ignore clause may not appear inside an it or a they clause.";
constexpr const char *kDescribeInsideIt = "A describe clause may not appear inside an it or a they clause.";
} // namespace

PathEngine::PathEngine(std::string concurrent_bundle_mod_message, std::string simple_class_name)
    : Engine(std::move(concurrent_bundle_mod_message), std::move(simple_class_name))
{
}

bool PathEngine::is_in_target_path(const Path &candidate, const std::optional<Path> &target)
{
    auto all_zero = [](auto first, auto last)
    { return std::all_of(first, last, [](int index) { return index == 0; }); };

    if (!target)
    {
        return all_zero(candidate.begin(), candidate.end());
    }
    if (candidate.size() < target->size())
    {
        return std::equal(candidate.begin(), candidate.end(), target->begin());
    }
    if (candidate.size() > target->size())
    {
        return std::equal(target->begin(), target->end(), candidate.begin()) &&
               all_zero(candidate.begin() + static_cast<std::ptrdiff_t>(target->size()), candidate.end());
    }
    return candidate == *target;
}

PathEngine::Path PathEngine::take_next_path()
{
    Path path = current_path_;
    path.push_back(0);
    while (used_paths_.count(path) != 0)
    {
        ++path.back();
    }
    used_paths_.insert(path);
    return path;
}

bool PathEngine::inside_test() const noexcept
{
    return test_running_.load(std::memory_order_acquire);
}

void PathEngine::reset_pass_state(std::optional<Path> target)
{
    target_path_ = std::move(target);
    next_target_path_.reset();
    current_path_.clear();
    used_paths_.clear();
    target_leaf_reached_ = false;
    leaves_encountered_ = 0;
}

void PathEngine::handle_nested_branch(const std::string &description,
                                      const std::optional<std::string> &child_prefix,
                                      const std::function<void()> &body,
                                      const std::string &registration_closed_message,
                                      const std::optional<LineInFile> &location)
{
    if (inside_test())
    {
        throw RegistrationClosedError(kDescribeInsideIt, location);
    }

    const Path path = take_next_path();
    if (target_leaf_reached_ && !next_target_path_)
    {
        next_target_path_ = path;
        return;
    }
    if (!is_in_target_path(path, target_path_))
    {
        return;
    }

    const Path enclosing = current_path_;
    current_path_ = path;
    auto restore_path = basics::make_scope_guard([this, &enclosing] { current_path_ = enclosing; });

    auto known = registered_branches_.find(path);
    if (known == registered_branches_.end())
    {
        const int leaves_before = leaves_encountered_;
        Branch *branch =
            register_nested_branch(description, child_prefix, body, registration_closed_message, location);
        registered_branches_.emplace(path, branch);
        // An empty branch is a target of its own.
        if (leaves_encountered_ == leaves_before)
        {
            target_leaf_reached_ = true;
        }
    }
    else
    {
        navigate_to_nested_branch(known->second, body, registration_closed_message, location);
    }
}

void PathEngine::handle_test(const std::string &test_text, const std::function<void()> &test_fun,
                             const std::string &registration_closed_message,
                             const std::optional<LineInFile> &location, const std::set<std::string> &test_tags)
{
    if (inside_test())
    {
        throw RegistrationClosedError(kItInsideIt, location);
    }

    ++leaves_encountered_;
    const Path path = take_next_path();
    if (!is_in_target_path(path, target_path_))
    {
        if (target_leaf_reached_ && !next_target_path_)
        {
            next_target_path_ = path;
        }
        return;
    }

    auto buffer = std::make_shared<PathMessageBuffer>();
    std::shared_ptr<MessageSink> test_informer = std::make_shared<PathRecordingSink>(MessageKind::Info, buffer);
    std::shared_ptr<MessageSink> test_documenter = std::make_shared<PathRecordingSink>(MessageKind::Markup, buffer);

    std::optional<Outcome> outcome;
    Millis duration{0};
    {
        test_running_.store(true, std::memory_order_release);
        auto clear_running = basics::make_scope_guard([this] { test_running_.store(false, std::memory_order_release); });
        auto old_informer = informer_slot().exchange(test_informer);
        auto old_documenter = documenter_slot().exchange(test_documenter);
        auto restore_sinks = make_cleanup_guard(
            [&]
            {
                swap_and_verify(informer_slot(), test_informer, old_informer,
                                "Informer slot was replaced while a path test was running");
                swap_and_verify(documenter_slot(), test_documenter, old_documenter,
                                "Documenter slot was replaced while a path test was running");
            },
            "path test cleanup");

        const uint64_t start_ns = platform::monotonic_time_ns();
        outcome = Outcome::capture(test_fun);
        duration = std::chrono::duration_cast<Millis>(std::chrono::nanoseconds(platform::elapsed_time_ns(start_ns)));
        restore_sinks.invoke_and_rethrow();
    }

    LOGGER_TRACE("path test '{}' at [{}] ran at construction: {}", test_text, fmt::join(path, ","),
                 to_string(*outcome));

    register_test(
        test_text, [observed = *outcome] { observed.replay(); }, registration_closed_message, location, test_tags,
        duration, buffer->take());
    target_leaf_reached_ = true;
}

void PathEngine::handle_ignored_test(const std::string &test_text, const std::function<void()> &test_fun,
                                     const std::string &registration_closed_message,
                                     const std::optional<LineInFile> &location,
                                     const std::set<std::string> &test_tags)
{
    if (inside_test())
    {
        throw RegistrationClosedError(kIgnoreInsideIt, location);
    }

    ++leaves_encountered_;
    const Path path = take_next_path();
    if (!is_in_target_path(path, target_path_))
    {
        if (target_leaf_reached_ && !next_target_path_)
        {
            next_target_path_ = path;
        }
        return;
    }

    // The body belongs to this pass's instance, which is gone by run time.
    (void)test_fun;
    register_ignored_test(test_text, [] { pending(); }, registration_closed_message, location, test_tags);
    target_leaf_reached_ = true;
}

void PathEngine::handle_message_leaf(MessageKind kind, const std::string &message,
                                     const std::optional<LineInFile> &location)
{
    if (inside_test() || registration_closed())
    {
        if (kind == MessageKind::Info)
        {
            inform(message, location);
        }
        else
        {
            document(message, location);
        }
        return;
    }

    ++leaves_encountered_;
    const Path path = take_next_path();
    if (!is_in_target_path(path, target_path_))
    {
        if (target_leaf_reached_ && !next_target_path_)
        {
            next_target_path_ = path;
        }
        return;
    }

    if (kind == MessageKind::Info)
    {
        inform(message, location);
    }
    else
    {
        document(message, location);
    }
    target_leaf_reached_ = true;
}

void PathEngine::handle_info(const std::string &message, const std::optional<LineInFile> &location)
{
    handle_message_leaf(MessageKind::Info, message, location);
}

void PathEngine::handle_markup(const std::string &message, const std::optional<LineInFile> &location)
{
    handle_message_leaf(MessageKind::Markup, message, location);
}

void PathEngine::ensure_test_results_registered(const std::function<void()> &construct)
{
    std::lock_guard<std::mutex> lock(passes_mutex_);
    if (results_registered_)
    {
        return;
    }
    results_registered_ = true;

    while (next_target_path_)
    {
        Path target = *next_target_path_;
        reset_pass_state(target);
        ++passes_;
        LOGGER_DEBUG("path engine pass {} targeting [{}]", passes_, fmt::join(target, ","));
        construct();
    }
    LOGGER_DEBUG("path engine finished after {} pass(es) with {} test(s)", passes_, test_names().size());
}

} // namespace treespec::engine
