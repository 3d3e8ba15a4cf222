// warning: this file is not intended to be used by users
// include assert-def.hpp / assert-undef.hpp in pairs to avoid leaking macros to users
#pragma once
#include <format>
#include <string_view>

// allow passing pointer to std::format without (void*) cast
template <class T, class CharT>
struct std::formatter<T*, CharT> : std::formatter<const void*, CharT> {
    template <class FormatContext>
    auto format(T* const ptr, FormatContext& ctx) const {
        return std::formatter<const void*, CharT>::format(static_cast<const void*>(ptr), ctx);
    }
};

namespace fanin {
inline auto format_filename(const std::string_view filename) -> std::string_view {
    if(const auto p = filename.rfind('/'); p != filename.npos) {
        return filename.substr(p + 1);
    } else {
        return filename;
    }
}
} // namespace fanin
