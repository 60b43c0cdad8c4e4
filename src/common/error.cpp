/**
 * @file error.cpp
 * @brief rendering for mcm::Error
 */
#include "mcm/common/error.hpp"

#include <string_view>

#include <fmt/core.h>

namespace mcm
{
namespace
{

[[nodiscard]] auto kind_name(ErrorKind kind) -> std::string_view
{
    switch (kind)
    {
    case ErrorKind::InvalidArgument:
        return "invalid argument";
    case ErrorKind::PoorlyConditioned:
        return "poorly conditioned";
    }
    return "unknown";
}

} // namespace

auto describe(const Error &error) -> std::string
{
    std::string text = fmt::format("{}: {}", kind_name(error.kind), error.message);
    if (error.context.empty())
    {
        return text;
    }
    text += " [";
    for (std::size_t i = 0; i < error.context.size(); ++i)
    {
        if (i > 0U)
        {
            text += " > ";
        }
        text += error.context[i];
    }
    text += ']';
    return text;
}

} // namespace mcm
