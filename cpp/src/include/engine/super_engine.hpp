#pragma once
/**
 * @file super_engine.hpp
 * @brief Registration tree and execution engine shared by every style.
 *
 * A style object owns one engine. While the style's constructor runs, the
 * DSL calls (`test`, `describe`, `it`, `info`, ...) register nodes into a
 * tree rooted at the trunk. The first `run` closes registration; from then
 * on the tree is read-only and the engine walks it, reporting events in tree
 * order and running each test the filter lets through.
 *
 * Mutable registration state lives in one immutable Bundle. Every change
 * builds a new Bundle and publishes it with a compare-exchange against the
 * snapshot it started from; a lost race means two threads registered at once
 * and fails with ConcurrentModificationError. The informer and documenter
 * slots follow the same discipline with exchange-and-verify.
 *
 * The engine is parameterised by the test-function type so that suites whose
 * tests take a fixture share the same machinery:
 * @code
 * using Engine = SuperEngine<std::function<void()>>;
 * template <typename F> using FixtureEngine = SuperEngine<std::function<void(F &)>>;
 * @endcode
 * The member definitions are in super_engine.inl.
 */
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "engine/collaborators.hpp"
#include "engine/errors.hpp"
#include "engine/events.hpp"
#include "engine/filter.hpp"
#include "engine/informers.hpp"
#include "engine/line_in_file.hpp"
#include "engine/message_recorder.hpp"
#include "engine/outcome.hpp"
#include "engine/suite.hpp"
#include "utils/atomic_slot.hpp"

namespace treespec::engine
{

template <typename TestFun> class SuperEngine
{
  public:
    using Millis = std::chrono::milliseconds;

    class Branch;
    class DescriptionBranch;
    struct TestLeaf;

    /// An `info` call made during registration, outside any test.
    struct InfoLeaf
    {
        Branch *parent{nullptr};
        std::string message;
        std::optional<LineInFile> location;
    };

    /// A `markup` call made during registration, outside any test.
    struct MarkupLeaf
    {
        Branch *parent{nullptr};
        std::string message;
        std::optional<LineInFile> location;
    };

    using Node = std::variant<std::shared_ptr<DescriptionBranch>, std::shared_ptr<const TestLeaf>, InfoLeaf,
                              MarkupLeaf>;

    /**
     * @class Branch
     * @brief An interior node. Children are kept in registration order and
     *        owned by the branch; the parent pointer is a non-owning back link.
     */
    class Branch
    {
      public:
        explicit Branch(Branch *parent) noexcept : parent_(parent) {}
        virtual ~Branch() = default;

        Branch(const Branch &) = delete;
        Branch &operator=(const Branch &) = delete;

        Branch *parent() const noexcept { return parent_; }
        const std::vector<Node> &children() const noexcept { return children_; }
        void append(Node node) { children_.push_back(std::move(node)); }

        /// Number of ancestors: 0 for the trunk, 1 for a top-level description.
        int depth() const noexcept
        {
            int d = 0;
            for (const Branch *b = parent_; b != nullptr; b = b->parent())
            {
                ++d;
            }
            return d;
        }

      private:
        Branch *parent_;
        std::vector<Node> children_;
    };

    class Trunk : public Branch
    {
      public:
        Trunk() noexcept : Branch(nullptr) {}
    };

    class DescriptionBranch : public Branch
    {
      public:
        DescriptionBranch(Branch *parent, std::string description, std::optional<std::string> child_prefix,
                          std::optional<LineInFile> location)
            : Branch(parent), description(std::move(description)), child_prefix(std::move(child_prefix)),
              location(std::move(location))
        {
        }

        /// Indentation of this branch's scope events.
        int indentation_level() const noexcept { return this->parent()->depth(); }

        std::string description;
        std::optional<std::string> child_prefix; ///< e.g. "when", "should"
        std::optional<LineInFile> location;
    };

    struct TestLeaf
    {
        Branch *parent{nullptr};
        std::string test_name;
        std::string test_text;
        TestFun test_fun;
        std::optional<LineInFile> location;
        /// Set when the test already ran at registration time (path style).
        std::optional<Millis> recorded_duration;
        std::optional<std::vector<RecordedMessage>> recorded_messages;

        int indentation_level() const noexcept { return parent->depth(); }
    };

    /**
     * @brief Registration state, replaced wholesale on every change.
     *
     * `current_branch` points into the tree owned by the engine's trunk.
     */
    struct Bundle
    {
        Branch *current_branch{nullptr};
        std::vector<std::string> test_names; ///< registration order
        std::map<std::string, std::shared_ptr<const TestLeaf>> tests;
        TagsMap tags;
        bool registration_closed{false};
    };

    /// Runs a leaf's body, supplying whatever fixture the style provides.
    using Invoker = std::function<Outcome(const TestLeaf &)>;
    using RunTestFn = std::function<void(const std::string &, const RunArgs &)>;
    using SuperRunFn = std::function<void(const std::optional<std::string> &, const RunArgs &)>;

    /**
     * @param concurrent_bundle_mod_message Message of the ConcurrentModificationError
     *        thrown when a registration loses a race.
     * @param simple_class_name Style name used in "can't call info now" complaints.
     */
    SuperEngine(std::string concurrent_bundle_mod_message, std::string simple_class_name);
    virtual ~SuperEngine() = default;

    SuperEngine(const SuperEngine &) = delete;
    SuperEngine &operator=(const SuperEngine &) = delete;

    // --- Registration ------------------------------------------------------

    /**
     * @brief Appends a test leaf to the current branch.
     * @return The full test name (branch prefix + text, trimmed).
     * @throws RegistrationClosedError after the first run.
     * @throws DuplicateTestNameError if the full name is already registered.
     */
    std::string register_test(const std::string &test_text, TestFun test_fun,
                              const std::string &registration_closed_message,
                              const std::optional<LineInFile> &location, const std::set<std::string> &test_tags = {},
                              std::optional<Millis> recorded_duration = std::nullopt,
                              std::optional<std::vector<RecordedMessage>> recorded_messages = std::nullopt);

    /**
     * @brief Registers a test and tags it with kIgnoreTagName.
     */
    std::string register_ignored_test(const std::string &test_text, TestFun test_fun,
                                      const std::string &registration_closed_message,
                                      const std::optional<LineInFile> &location,
                                      const std::set<std::string> &test_tags = {},
                                      std::optional<Millis> recorded_duration = std::nullopt,
                                      std::optional<std::vector<RecordedMessage>> recorded_messages = std::nullopt);

    /**
     * @brief Appends a description branch, makes it current while @p body
     *        runs, then restores the previous current branch.
     * @return The new branch, owned by the tree.
     */
    Branch *register_nested_branch(const std::string &description, const std::optional<std::string> &child_prefix,
                                   const std::function<void()> &body, const std::string &registration_closed_message,
                                   const std::optional<LineInFile> &location);

    /**
     * @brief Appends a description branch to the trunk and leaves it current.
     *        Used by styles whose descriptions do not nest.
     */
    void register_flat_branch(const std::string &description, const std::string &registration_closed_message,
                              const std::optional<LineInFile> &location);

    bool current_branch_is_trunk() const;

    /// Sends @p message through the current informer slot occupant.
    void inform(const std::string &message, const std::optional<LineInFile> &location) const;
    /// Sends @p message through the current documenter slot occupant.
    void document(const std::string &message, const std::optional<LineInFile> &location) const;

    // --- Queries -----------------------------------------------------------

    std::vector<std::string> test_names() const;
    TagsMap tags() const;
    bool registration_closed() const;
    const Trunk &trunk() const noexcept { return *trunk_; }

    /**
     * @brief Child indices from the trunk down to the named test.
     * @throws UnknownTestError
     */
    std::vector<int> test_path(const std::string &test_name) const;

    /// Trimmed concatenation of the descriptions (and child prefixes) above @p branch.
    std::string get_test_name_prefix(const Branch &branch) const;
    std::string get_test_name(const std::string &test_text, const Branch &parent) const;
    /// "prefix text" when @p branch carries a child prefix, @p text otherwise.
    std::string prepend_child_prefix(const Branch &branch, const std::string &text) const;

    // --- Execution ---------------------------------------------------------

    /**
     * @brief Runs one registered test and reports its start and outcome.
     *
     * While the body runs, both slots hold a RecordingSink over one
     * MessageRecorder, so messages the body sends are reported after the
     * outcome and tagged with it.
     *
     * @throws UnknownTestError if no test has @p test_name.
     * @throws ConcurrentModificationError if a slot was replaced during the test.
     */
    void run_test_impl(const Suite &suite, const std::string &test_name, const RunArgs &args,
                       const Invoker &invoke_with_fixture);

    /**
     * @brief Walks the tree (or looks up the single named test) and calls
     *        @p run_test for each test the filter lets through.
     *
     * @p args reach @p run_test unchanged. The engine never reads
     * `args.distributor`; it is there for the suite's own run hooks.
     */
    void run_tests_impl(const Suite &suite, const std::optional<std::string> &test_name, const RunArgs &args,
                        const RunTestFn &run_test);

    /**
     * @brief Closes registration, installs the run-time sinks, calls
     *        @p super_run, then installs the zombie sinks.
     */
    void run_impl(const Suite &suite, const std::optional<std::string> &test_name, const RunArgs &args,
                  const SuperRunFn &super_run);

  protected:
    std::shared_ptr<const Bundle> load_bundle() const { return bundle_slot_.load(); }

    /**
     * @brief Publishes @p next if the slot still holds @p expected.
     * @throws ConcurrentModificationError otherwise.
     */
    void update_bundle(const std::shared_ptr<const Bundle> &expected, std::shared_ptr<const Bundle> next);

    /**
     * @brief Makes an already-registered branch current while @p body runs.
     *        The path engine uses it to re-enter a branch on a later pass.
     */
    void navigate_to_nested_branch(Branch *branch, const std::function<void()> &body,
                                   const std::string &registration_closed_message,
                                   const std::optional<LineInFile> &location);

    utils::AtomicSlot<Informer> &informer_slot() noexcept { return informer_slot_; }
    utils::AtomicSlot<Documenter> &documenter_slot() noexcept { return documenter_slot_; }

    /// Replaces the occupant of @p slot and checks that it held @p expected.
    static void swap_and_verify(utils::AtomicSlot<MessageSink> &slot, const std::shared_ptr<MessageSink> &expected,
                                std::shared_ptr<MessageSink> next, const std::string &message);

    const std::string &concurrent_bundle_mod_message() const noexcept { return concurrent_bundle_mod_message_; }

  private:
    void register_message_leaf(MessageKind kind, const std::string &message,
                               const std::optional<LineInFile> &location);
    void run_tests_in_branch(const Suite &suite, const Branch &branch, const RunArgs &args, const RunTestFn &run_test);
    void run_or_report_ignored(const Suite &suite, const TestLeaf &leaf, const RunArgs &args,
                               const RunTestFn &run_test);

    std::string concurrent_bundle_mod_message_;
    std::string simple_class_name_;
    std::shared_ptr<Trunk> trunk_;
    utils::AtomicSlot<const Bundle> bundle_slot_;
    utils::AtomicSlot<Informer> informer_slot_;
    utils::AtomicSlot<Documenter> documenter_slot_;
    std::shared_ptr<MessageSink> zombie_informer_;
    std::shared_ptr<MessageSink> zombie_documenter_;
};

using Engine = SuperEngine<std::function<void()>>;

template <typename Fixture> using FixtureEngine = SuperEngine<std::function<void(Fixture &)>>;

} // namespace treespec::engine

#include "engine/super_engine.inl"
