/**
 * @file outcome.hpp
 * @brief Explicit result of invoking one test body.
 *
 * The invocation boundary between a style's fixture strategy and the engine
 * returns an `Outcome` instead of letting pending and canceled signals travel
 * as exceptions through the engine. Abort-worthy errors are the exception:
 * `Outcome::capture` rethrows them unwrapped.
 *
 * Usage:
 * @code
 * Outcome outcome = Outcome::capture([&] { leaf.test_fun(); });
 * if (outcome.is_failed()) { ... outcome.message() ... }
 * @endcode
 */
#pragma once

#include <exception>
#include <new>
#include <string>
#include <utility>
#include <variant>

#include "engine/errors.hpp"
#include "treespec_export.h"

namespace treespec::engine
{

class TREESPEC_EXPORT Outcome
{
  public:
    struct Succeeded
    {
    };
    struct Failed
    {
        std::exception_ptr error;
    };
    struct Pending
    {
    };
    struct Canceled
    {
        std::exception_ptr error;
    };

    using Content = std::variant<Succeeded, Failed, Pending, Canceled>;

    [[nodiscard]] static Outcome succeeded() { return Outcome(Succeeded{}); }
    [[nodiscard]] static Outcome failed(std::exception_ptr error) { return Outcome(Failed{std::move(error)}); }
    [[nodiscard]] static Outcome pending() { return Outcome(Pending{}); }
    [[nodiscard]] static Outcome canceled(std::exception_ptr error)
    {
        return Outcome(Canceled{std::move(error)});
    }

    /**
     * @brief Runs @p body and classifies how it ended.
     *
     * Normal return is Succeeded, `TestPendingException` is Pending,
     * `TestCanceledException` is Canceled, and anything else is Failed,
     * except the abort-worthy set (`std::bad_alloc`, `std::bad_exception`,
     * `AbortRunError`), which propagates.
     */
    template <typename F> [[nodiscard]] static Outcome capture(F &&body)
    {
        try
        {
            std::forward<F>(body)();
            return succeeded();
        }
        catch (const std::bad_alloc &)
        {
            throw;
        }
        catch (const std::bad_exception &)
        {
            throw;
        }
        catch (const AbortRunError &)
        {
            throw;
        }
        catch (const TestPendingException &)
        {
            return pending();
        }
        catch (const TestCanceledException &)
        {
            return canceled(std::current_exception());
        }
        catch (...)
        {
            return failed(std::current_exception());
        }
    }

    bool is_succeeded() const noexcept { return std::holds_alternative<Succeeded>(m_data); }
    bool is_failed() const noexcept { return std::holds_alternative<Failed>(m_data); }
    bool is_pending() const noexcept { return std::holds_alternative<Pending>(m_data); }
    bool is_canceled() const noexcept { return std::holds_alternative<Canceled>(m_data); }

    const Content &content() const noexcept { return m_data; }

    /// The stored exception for Failed and Canceled, null otherwise.
    std::exception_ptr error() const noexcept;

    /// `what()` of the stored exception, empty for Succeeded and Pending.
    std::string message() const;

    /**
     * @brief Re-raises what was observed: returns for Succeeded, throws
     *        `TestPendingException` for Pending, rethrows the stored error otherwise.
     *
     * The path engine registers `[o] { o.replay(); }` as the body of a test
     * that already ran during construction.
     */
    void replay() const;

  private:
    explicit Outcome(Content data) : m_data(std::move(data)) {}

    Content m_data;
};

TREESPEC_EXPORT const char *to_string(const Outcome &outcome) noexcept;

} // namespace treespec::engine
