//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_COMMON_HELPERS_HPP_INCLUDED
#define DOCMAP_COMMON_HELPERS_HPP_INCLUDED

#include <spdlog/spdlog.h>

#include <cctype>
#include <exception>
#include <string>
#include <utility>

namespace docmap
{
namespace common
{

/// @brief Wraps the given action into a try/catch block, and performs it without throwing the given exception type.
///
/// @return `true` if the action was performed successfully, `false` if an exception was thrown
///         (it is logged as critical). Always `true` if exceptions are disabled.
///
template <typename Exception = std::exception, typename Action>
bool performWithoutThrowing(Action&& action) noexcept
{
#if defined(__cpp_exceptions)
    try
    {
#endif
        std::forward<Action>(action)();
        return true;

#if defined(__cpp_exceptions)
    } catch (const Exception& ex)
    {
        spdlog::critical("Unexpected C++ exception is caught: {}", ex.what());
        return false;
    }
#endif
}

/// Converts a CamelCase type name into a snake_case one, f.e. `BlogPost` -> `blog_post`.
///
/// Every upper case letter starts a new word, so `HTTPLog` becomes `h_t_t_p_log`.
///
inline std::string toSnakeCase(const std::string& camel_case)
{
    std::string result;
    result.reserve(camel_case.size() * 2);
    for (const char ch : camel_case)
    {
        const auto uch = static_cast<unsigned char>(ch);
        if (std::isupper(uch) != 0)
        {
            if (!result.empty())
            {
                result += '_';
            }
            result += static_cast<char>(std::tolower(uch));
        }
        else
        {
            result += ch;
        }
    }
    return result;
}

}  // namespace common
}  // namespace docmap

#endif  // DOCMAP_COMMON_HELPERS_HPP_INCLUDED
