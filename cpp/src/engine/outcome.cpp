#include "engine/outcome.hpp"

#include <type_traits>

namespace treespec::engine
{

std::exception_ptr Outcome::error() const noexcept
{
    return std::visit(
        [](const auto &arg) -> std::exception_ptr
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, Failed> || std::is_same_v<T, Canceled>)
            {
                return arg.error;
            }
            else
            {
                return nullptr;
            }
        },
        m_data);
}

std::string Outcome::message() const
{
    return describe_exception(error());
}

void Outcome::replay() const
{
    if (is_succeeded())
        return;
    if (is_pending())
        throw TestPendingException();
    std::rethrow_exception(error());
}

const char *to_string(const Outcome &outcome) noexcept
{
    if (outcome.is_succeeded())
        return "succeeded";
    if (outcome.is_failed())
        return "failed";
    if (outcome.is_pending())
        return "pending";
    return "canceled";
}

} // namespace treespec::engine
