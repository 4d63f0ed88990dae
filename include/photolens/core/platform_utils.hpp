#pragma once

/** \file platform_utils.hpp
 *  \brief Environment access for PHOTOLENS_* settings.
 */

#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace photolens::core {

/** \brief getenv that copies the value out.
 *
 * Unset (or a null/empty name) gives nullopt; a variable set to "" gives an
 * engaged empty string. On Windows the _dupenv_s buffer is released here.
 */
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* raw = nullptr;
    size_t n = 0;
    if (_dupenv_s(&raw, &n, name) != 0 || raw == nullptr) {
        std::free(raw);
        return std::nullopt;
    }
    std::optional<std::string> out(std::in_place, raw);
    std::free(raw);
    return out;
#else
    if (const char* raw = std::getenv(name)) return std::string(raw);
    return std::nullopt;
#endif
}

/** \brief Value of a variable that is set to something other than "". */
inline std::optional<std::string> env_nonempty(const char* name) noexcept {
    auto v = safe_getenv(name);
    if (!v || v->empty()) return std::nullopt;
    return v;
}

namespace detail {
inline bool spelled_as(std::string_view v, std::initializer_list<std::string_view> words) noexcept {
    for (auto w : words) {
        if (w.size() != v.size()) continue;
        bool same = true;
        for (std::size_t i = 0; i < v.size() && same; ++i) {
            const char c = v[i];
            same = ((c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c) == w[i];
        }
        if (same) return true;
    }
    return false;
}
} // namespace detail

// Case-insensitive "1", "true", "on", "yes".
inline bool env_truthy(std::string_view v) noexcept {
    return detail::spelled_as(v, {"1", "true", "on", "yes"});
}

// Case-insensitive "0", "false", "off", "no".
inline bool env_falsy(std::string_view v) noexcept {
    return detail::spelled_as(v, {"0", "false", "off", "no"});
}

} // namespace photolens::core
