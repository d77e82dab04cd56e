#ifndef LOCALIZATION_HPP
#define LOCALIZATION_HPP

#include <cstdio>
#include <filesystem>
#include <string>
#include <type_traits>
#include <vector>

void init_localization();
void set_l10n_dir(const std::filesystem::path& dir);
const std::string& get_string(const std::string& key);

namespace l10n_detail {
    inline const char* format_arg(const std::string& s) { return s.c_str(); }
    inline const char* format_arg(const char* s) { return s; }
    template<typename T>
    std::enable_if_t<std::is_arithmetic_v<T>, T> format_arg(T v) { return v; }
}

// Variadic template for string formatting; catalogue entries use printf conversions
template<typename... Args>
std::string string_format(const std::string& format_key, const Args&... args) {
    const std::string& format = get_string(format_key);
    int size = std::snprintf(nullptr, 0, format.c_str(), l10n_detail::format_arg(args)...) + 1; // Extra space for '\0'
    if (size <= 1) { return format; }
    std::vector<char> buf(size);
    std::snprintf(buf.data(), size, format.c_str(), l10n_detail::format_arg(args)...);
    return std::string(buf.data(), buf.data() + size - 1); // We don't want the '\0' inside
}

#endif // LOCALIZATION_HPP
