// super_engine.inl
#pragma once
// Member definitions of SuperEngine. Included from super_engine.hpp only.

#include <algorithm>
#include <type_traits>

#include <fmt/format.h>

#include "engine/cleanup_guard.hpp"
#include "engine/reporting.hpp"
#include "tsp_platform.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

namespace treespec::engine
{

template <typename TestFun>
SuperEngine<TestFun>::SuperEngine(std::string concurrent_bundle_mod_message, std::string simple_class_name)
    : concurrent_bundle_mod_message_(std::move(concurrent_bundle_mod_message)),
      simple_class_name_(std::move(simple_class_name)), trunk_(std::make_shared<Trunk>())
{
    auto initial = std::make_shared<Bundle>();
    initial->current_branch = trunk_.get();
    (void)bundle_slot_.exchange(std::move(initial));

    // Registration phase: info and markup become leaves of the current branch.
    (void)informer_slot_.exchange(std::make_shared<FunctionSink>(
        [this](const std::string &message, const std::optional<LineInFile> &location)
        { register_message_leaf(MessageKind::Info, message, location); }));
    (void)documenter_slot_.exchange(std::make_shared<FunctionSink>(
        [this](const std::string &message, const std::optional<LineInFile> &location)
        { register_message_leaf(MessageKind::Markup, message, location); }));

    zombie_informer_ = std::make_shared<ZombieSink>(
        fmt::format("Can't call info now for {}: the suite has finished running", simple_class_name_));
    zombie_documenter_ = std::make_shared<ZombieSink>(
        fmt::format("Can't call markup now for {}: the suite has finished running", simple_class_name_));
}

// ============================================================================
// Bundle and slot plumbing
// ============================================================================

template <typename TestFun>
void SuperEngine<TestFun>::update_bundle(const std::shared_ptr<const Bundle> &expected,
                                         std::shared_ptr<const Bundle> next)
{
    if (!bundle_slot_.compare_exchange(expected, std::move(next)))
    {
        LOGGER_ERROR("[{}] registration state changed underneath a registration call", simple_class_name_);
        throw ConcurrentModificationError(concurrent_bundle_mod_message_);
    }
}

template <typename TestFun>
void SuperEngine<TestFun>::swap_and_verify(utils::AtomicSlot<MessageSink> &slot,
                                           const std::shared_ptr<MessageSink> &expected,
                                           std::shared_ptr<MessageSink> next, const std::string &message)
{
    auto previous = slot.exchange(std::move(next));
    if (previous != expected)
    {
        throw ConcurrentModificationError(message);
    }
}

template <typename TestFun>
void SuperEngine<TestFun>::register_message_leaf(MessageKind kind, const std::string &message,
                                                 const std::optional<LineInFile> &location)
{
    auto old_bundle = load_bundle();
    Branch *branch = old_bundle->current_branch;
    // Publish first so a lost race leaves the tree untouched.
    update_bundle(old_bundle, std::make_shared<const Bundle>(*old_bundle));
    if (kind == MessageKind::Info)
    {
        branch->append(InfoLeaf{branch, message, location});
    }
    else
    {
        branch->append(MarkupLeaf{branch, message, location});
    }
}

// ============================================================================
// Registration
// ============================================================================

template <typename TestFun>
std::string SuperEngine<TestFun>::register_test(const std::string &test_text, TestFun test_fun,
                                                const std::string &registration_closed_message,
                                                const std::optional<LineInFile> &location,
                                                const std::set<std::string> &test_tags,
                                                std::optional<Millis> recorded_duration,
                                                std::optional<std::vector<RecordedMessage>> recorded_messages)
{
    auto old_bundle = load_bundle();
    if (old_bundle->registration_closed)
    {
        throw RegistrationClosedError(registration_closed_message, location);
    }

    Branch *parent = old_bundle->current_branch;
    std::string test_name = get_test_name(test_text, *parent);
    if (old_bundle->tests.count(test_name) != 0)
    {
        throw DuplicateTestNameError(test_name, location);
    }

    auto leaf = std::make_shared<const TestLeaf>(TestLeaf{parent, test_name, test_text, std::move(test_fun), location,
                                                          recorded_duration, std::move(recorded_messages)});

    auto next = std::make_shared<Bundle>(*old_bundle);
    next->test_names.push_back(test_name);
    next->tests.emplace(test_name, leaf);
    if (!test_tags.empty())
    {
        next->tags[test_name].insert(test_tags.begin(), test_tags.end());
    }
    update_bundle(old_bundle, std::move(next));

    parent->append(std::move(leaf));
    LOGGER_TRACE("[{}] registered test '{}'", simple_class_name_, test_name);
    return test_name;
}

template <typename TestFun>
std::string SuperEngine<TestFun>::register_ignored_test(const std::string &test_text, TestFun test_fun,
                                                        const std::string &registration_closed_message,
                                                        const std::optional<LineInFile> &location,
                                                        const std::set<std::string> &test_tags,
                                                        std::optional<Millis> recorded_duration,
                                                        std::optional<std::vector<RecordedMessage>> recorded_messages)
{
    std::string test_name = register_test(test_text, std::move(test_fun), registration_closed_message, location,
                                          test_tags, recorded_duration, std::move(recorded_messages));

    auto old_bundle = load_bundle();
    auto next = std::make_shared<Bundle>(*old_bundle);
    next->tags[test_name].insert(std::string(kIgnoreTagName));
    update_bundle(old_bundle, std::move(next));
    return test_name;
}

template <typename TestFun>
typename SuperEngine<TestFun>::Branch *
SuperEngine<TestFun>::register_nested_branch(const std::string &description,
                                             const std::optional<std::string> &child_prefix,
                                             const std::function<void()> &body,
                                             const std::string &registration_closed_message,
                                             const std::optional<LineInFile> &location)
{
    auto old_bundle = load_bundle();
    if (old_bundle->registration_closed)
    {
        throw RegistrationClosedError(registration_closed_message, location);
    }

    Branch *old_branch = old_bundle->current_branch;
    auto branch = std::make_shared<DescriptionBranch>(old_branch, description, child_prefix, location);
    Branch *raw = branch.get();

    auto entered = std::make_shared<Bundle>(*old_bundle);
    entered->current_branch = raw;
    update_bundle(old_bundle, std::move(entered));
    old_branch->append(std::move(branch));

    body();

    auto after_body = load_bundle();
    auto restored = std::make_shared<Bundle>(*after_body);
    restored->current_branch = old_branch;
    update_bundle(after_body, std::move(restored));
    return raw;
}

template <typename TestFun>
void SuperEngine<TestFun>::navigate_to_nested_branch(Branch *branch, const std::function<void()> &body,
                                                     const std::string &registration_closed_message,
                                                     const std::optional<LineInFile> &location)
{
    auto old_bundle = load_bundle();
    if (old_bundle->registration_closed)
    {
        throw RegistrationClosedError(registration_closed_message, location);
    }

    Branch *old_branch = old_bundle->current_branch;
    auto entered = std::make_shared<Bundle>(*old_bundle);
    entered->current_branch = branch;
    update_bundle(old_bundle, std::move(entered));

    body();

    auto after_body = load_bundle();
    auto restored = std::make_shared<Bundle>(*after_body);
    restored->current_branch = old_branch;
    update_bundle(after_body, std::move(restored));
}

template <typename TestFun>
void SuperEngine<TestFun>::register_flat_branch(const std::string &description,
                                                const std::string &registration_closed_message,
                                                const std::optional<LineInFile> &location)
{
    auto old_bundle = load_bundle();
    if (old_bundle->registration_closed)
    {
        throw RegistrationClosedError(registration_closed_message, location);
    }

    auto branch = std::make_shared<DescriptionBranch>(trunk_.get(), description, std::nullopt, location);
    auto next = std::make_shared<Bundle>(*old_bundle);
    next->current_branch = branch.get();
    update_bundle(old_bundle, std::move(next));
    trunk_->append(std::move(branch));
}

template <typename TestFun> bool SuperEngine<TestFun>::current_branch_is_trunk() const
{
    return load_bundle()->current_branch == trunk_.get();
}

template <typename TestFun>
void SuperEngine<TestFun>::inform(const std::string &message, const std::optional<LineInFile> &location) const
{
    informer_slot_.load()->apply(message, location);
}

template <typename TestFun>
void SuperEngine<TestFun>::document(const std::string &message, const std::optional<LineInFile> &location) const
{
    documenter_slot_.load()->apply(message, location);
}

// ============================================================================
// Queries
// ============================================================================

template <typename TestFun> std::vector<std::string> SuperEngine<TestFun>::test_names() const
{
    return load_bundle()->test_names;
}

template <typename TestFun> TagsMap SuperEngine<TestFun>::tags() const
{
    return load_bundle()->tags;
}

template <typename TestFun> bool SuperEngine<TestFun>::registration_closed() const
{
    return load_bundle()->registration_closed;
}

namespace detail
{
template <typename T> struct is_shared_ptr : std::false_type
{
};
template <typename T> struct is_shared_ptr<std::shared_ptr<T>> : std::true_type
{
};

// Position of @p node among @p children, matched by address.
template <typename NodeVariant> int child_index(const std::vector<NodeVariant> &children, const void *node)
{
    for (size_t i = 0; i < children.size(); ++i)
    {
        const void *candidate = std::visit(
            [](const auto &child) -> const void *
            {
                if constexpr (is_shared_ptr<std::decay_t<decltype(child)>>::value)
                {
                    return child.get();
                }
                else
                {
                    return &child;
                }
            },
            children[i]);
        if (candidate == node)
        {
            return static_cast<int>(i);
        }
    }
    return -1;
}
} // namespace detail

template <typename TestFun> std::vector<int> SuperEngine<TestFun>::test_path(const std::string &test_name) const
{
    auto bundle = load_bundle();
    auto it = bundle->tests.find(test_name);
    if (it == bundle->tests.end())
    {
        throw UnknownTestError(test_name);
    }

    std::vector<int> path;
    const void *node = it->second.get();
    for (const Branch *parent = it->second->parent; parent != nullptr; parent = parent->parent())
    {
        path.push_back(detail::child_index(parent->children(), node));
        node = parent;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

template <typename TestFun> std::string SuperEngine<TestFun>::get_test_name_prefix(const Branch &branch) const
{
    const auto *description = dynamic_cast<const DescriptionBranch *>(&branch);
    if (description == nullptr)
    {
        return {};
    }
    std::string own = description->child_prefix
                          ? format_tools::join_trimmed(description->description, *description->child_prefix)
                          : description->description;
    return format_tools::join_trimmed(get_test_name_prefix(*branch.parent()), own);
}

template <typename TestFun>
std::string SuperEngine<TestFun>::get_test_name(const std::string &test_text, const Branch &parent) const
{
    return format_tools::join_trimmed(get_test_name_prefix(parent), test_text);
}

template <typename TestFun>
std::string SuperEngine<TestFun>::prepend_child_prefix(const Branch &branch, const std::string &text) const
{
    const auto *description = dynamic_cast<const DescriptionBranch *>(&branch);
    if (description != nullptr && description->child_prefix)
    {
        return fmt::format("{} {}", *description->child_prefix, text);
    }
    return text;
}

// ============================================================================
// Execution
// ============================================================================

template <typename TestFun>
void SuperEngine<TestFun>::run_test_impl(const Suite &suite, const std::string &test_name, const RunArgs &args,
                                         const Invoker &invoke_with_fixture)
{
    args.require_non_null();
    if (!invoke_with_fixture)
    {
        throw NullArgumentError("invoke_with_fixture was null");
    }

    auto bundle = load_bundle();
    auto found = bundle->tests.find(test_name);
    if (found == bundle->tests.end())
    {
        throw UnknownTestError(test_name);
    }
    const std::shared_ptr<const TestLeaf> leaf = found->second;

    const std::string &suite_name = suite.suite_name();
    const std::string test_text = prepend_child_prefix(*leaf->parent, leaf->test_text);
    const int level = leaf->indentation_level();
    const IndentedText formatter = indented_text_for_test(test_text, level);

    reporting::report_test_starting(args, suite_name, test_name, test_text, leaf->location);

    // The recorder may be reached from worker threads after this frame is
    // gone, so the fire function owns copies of what it needs.
    auto recorder = std::make_shared<MessageRecorder>(
        [run_args = args, suite_name, test_name, level](const RecordedMessage &message, bool is_constructing,
                                                        bool was_pending, bool was_canceled)
        {
            reporting::report_message_provided(run_args, suite_name, message.kind, test_name, message.message,
                                               level + 1, message.location, is_constructing, was_pending,
                                               was_canceled);
        });

    std::shared_ptr<MessageSink> test_informer = std::make_shared<RecordingSink>(MessageKind::Info, recorder);
    std::shared_ptr<MessageSink> test_documenter = std::make_shared<RecordingSink>(MessageKind::Markup, recorder);
    auto old_informer = informer_slot_.exchange(test_informer);
    auto old_documenter = documenter_slot_.exchange(test_documenter);

    std::optional<Outcome> outcome;
    auto cleanup = make_cleanup_guard(
        [&]
        {
            const bool was_pending = outcome && outcome->is_pending();
            const bool was_canceled = outcome && outcome->is_canceled();
            recorder->fire_recorded_messages(was_pending, was_canceled);
            if (leaf->recorded_messages)
            {
                for (const RecordedMessage &message : *leaf->recorded_messages)
                {
                    reporting::report_message_provided(args, suite_name, message.kind, test_name, message.message,
                                                       level + 1, message.location,
                                                       message.from_constructing_thread, was_pending, was_canceled);
                }
            }
            swap_and_verify(informer_slot_, test_informer, old_informer,
                            "Informer slot was replaced while a test was running");
            swap_and_verify(documenter_slot_, test_documenter, old_documenter,
                            "Documenter slot was replaced while a test was running");
        },
        "test cleanup");

    const uint64_t start_ns = platform::monotonic_time_ns();
    outcome = invoke_with_fixture(*leaf);
    const Millis duration = leaf->recorded_duration.value_or(std::chrono::duration_cast<Millis>(
        std::chrono::nanoseconds(platform::elapsed_time_ns(start_ns))));

    LOGGER_TRACE("[{}] test '{}' finished: {}", suite_name, test_name, to_string(*outcome));

    std::visit(
        [&](const auto &content)
        {
            using T = std::decay_t<decltype(content)>;
            if constexpr (std::is_same_v<T, Outcome::Succeeded>)
            {
                reporting::report_test_succeeded(args, suite_name, test_name, test_text, duration, formatter,
                                                 leaf->location);
            }
            else if constexpr (std::is_same_v<T, Outcome::Failed>)
            {
                reporting::report_test_failed(args, suite_name, content.error, test_name, test_text, duration,
                                              formatter, leaf->location);
            }
            else if constexpr (std::is_same_v<T, Outcome::Pending>)
            {
                reporting::report_test_pending(args, suite_name, test_name, test_text, duration, formatter,
                                               leaf->location);
            }
            else
            {
                reporting::report_test_canceled(args, suite_name, content.error, test_name, test_text, duration,
                                                formatter, leaf->location);
            }
        },
        outcome->content());

    cleanup.invoke_and_rethrow();
}

template <typename TestFun>
void SuperEngine<TestFun>::run_or_report_ignored(const Suite &suite, const TestLeaf &leaf, const RunArgs &args,
                                                 const RunTestFn &run_test)
{
    const FilterDecision decision = args.filter.apply(leaf.test_name, load_bundle()->tags);
    if (decision.excluded)
    {
        return;
    }
    if (decision.ignored)
    {
        reporting::report_test_ignored(args, suite.suite_name(), leaf.test_name,
                                       prepend_child_prefix(*leaf.parent, leaf.test_text),
                                       leaf.indentation_level(), leaf.location);
        return;
    }
    run_test(leaf.test_name, args);
}

template <typename TestFun>
void SuperEngine<TestFun>::run_tests_in_branch(const Suite &suite, const Branch &branch, const RunArgs &args,
                                               const RunTestFn &run_test)
{
    const auto *description = dynamic_cast<const DescriptionBranch *>(&branch);
    std::string scope_text;
    if (description != nullptr)
    {
        scope_text = prepend_child_prefix(*branch.parent(), description->description);
        reporting::report_scope_opened(args, suite.suite_name(), scope_text, description->indentation_level(),
                                       description->location);
    }

    for (const Node &node : branch.children())
    {
        if (args.stopper())
        {
            LOGGER_DEBUG("[{}] stop requested; remaining nodes are skipped", suite.suite_name());
            break;
        }
        std::visit(
            [&](const auto &child)
            {
                using T = std::decay_t<decltype(child)>;
                if constexpr (std::is_same_v<T, std::shared_ptr<DescriptionBranch>>)
                {
                    run_tests_in_branch(suite, *child, args, run_test);
                }
                else if constexpr (std::is_same_v<T, std::shared_ptr<const TestLeaf>>)
                {
                    run_or_report_ignored(suite, *child, args, run_test);
                }
                else if constexpr (std::is_same_v<T, InfoLeaf>)
                {
                    reporting::report_message_provided(args, suite.suite_name(), MessageKind::Info, std::nullopt,
                                                       child.message, child.parent->depth(), child.location, true);
                }
                else
                {
                    reporting::report_message_provided(args, suite.suite_name(), MessageKind::Markup,
                                                       std::nullopt, child.message, child.parent->depth(),
                                                       child.location, true);
                }
            },
            node);
    }

    if (description != nullptr)
    {
        reporting::report_scope_closed(args, suite.suite_name(), scope_text, description->indentation_level(),
                                       description->location);
    }
}

template <typename TestFun>
void SuperEngine<TestFun>::run_tests_impl(const Suite &suite, const std::optional<std::string> &test_name,
                                          const RunArgs &args, const RunTestFn &run_test)
{
    args.require_non_null();
    if (!run_test)
    {
        throw NullArgumentError("run_test was null");
    }

    if (!test_name)
    {
        run_tests_in_branch(suite, *trunk_, args, run_test);
        return;
    }

    auto bundle = load_bundle();
    const FilterDecision decision = args.filter.apply(*test_name, bundle->tags);
    if (decision.excluded)
    {
        return;
    }
    if (decision.ignored)
    {
        auto found = bundle->tests.find(*test_name);
        if (found == bundle->tests.end())
        {
            throw UnknownTestError(*test_name);
        }
        reporting::report_test_ignored(args, suite.suite_name(), *test_name, *test_name, 1,
                                       found->second->location);
        return;
    }
    run_test(*test_name, args);
}

template <typename TestFun>
void SuperEngine<TestFun>::run_impl(const Suite &suite, const std::optional<std::string> &test_name,
                                    const RunArgs &args, const SuperRunFn &super_run)
{
    args.require_non_null();
    if (!super_run)
    {
        throw NullArgumentError("super_run was null");
    }

    // Already closed on a rerun: skip the swap, a conflict here would be spurious.
    if (auto old_bundle = load_bundle(); !old_bundle->registration_closed)
    {
        auto closed = std::make_shared<Bundle>(*old_bundle);
        closed->registration_closed = true;
        update_bundle(old_bundle, std::move(closed));
        LOGGER_DEBUG("[{}] registration closed with {} test(s)", suite.suite_name(), old_bundle->test_names.size());
    }

    const std::string suite_name = suite.suite_name();
    std::shared_ptr<MessageSink> run_informer = std::make_shared<ConcurrentSink>(
        [run_args = args, suite_name](const std::string &message, const std::optional<LineInFile> &location,
                                      bool from_constructing_thread)
        {
            reporting::report_message_provided(run_args, suite_name, MessageKind::Info, std::nullopt, message, 1,
                                               location, from_constructing_thread);
        });
    std::shared_ptr<MessageSink> run_documenter = std::make_shared<ConcurrentSink>(
        [run_args = args, suite_name](const std::string &message, const std::optional<LineInFile> &location,
                                      bool from_constructing_thread)
        {
            reporting::report_message_provided(run_args, suite_name, MessageKind::Markup, std::nullopt, message,
                                               1, location, from_constructing_thread);
        });
    (void)informer_slot_.exchange(run_informer);
    (void)documenter_slot_.exchange(run_documenter);

    auto cleanup = make_cleanup_guard(
        [&]
        {
            swap_and_verify(informer_slot_, run_informer, zombie_informer_,
                            "Informer slot was replaced while the suite was running");
            swap_and_verify(documenter_slot_, run_documenter, zombie_documenter_,
                            "Documenter slot was replaced while the suite was running");
        },
        "suite cleanup");

    super_run(test_name, args);

    cleanup.invoke_and_rethrow();
}

} // namespace treespec::engine
