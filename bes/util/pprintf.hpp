#pragma once

// printf-like formatting that returns std::string: '{}' placeholders are
// substituted in order, as fmt::format.

#include <string>
#include <utility>

#include <fmt/format.h>

namespace bes {
namespace util {

template <typename... Args>
std::string pprintf(const char* s, Args&&... args) {
    return fmt::format(fmt::runtime(s), std::forward<Args>(args)...);
}

} // namespace util
} // namespace bes
