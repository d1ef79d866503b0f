#pragma once

#include <cstdarg>
#include <cstdio>
#include <string>

namespace sightline_rt::utils {

inline std::string vprintf_to_string(const char* fmt, va_list args)
{
    va_list args_copy;
    va_copy(args_copy, args);

    int size = std::vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);

    if (size < 0)
        return {};

    std::string result(size, '\0');
    std::vsnprintf(result.data(), result.size() + 1, fmt, args);

    return result;
}

} // namespace sightline_rt::utils
