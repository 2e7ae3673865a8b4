#ifndef VERTOPAL_UTIL_FORMAT_HPP
#define VERTOPAL_UTIL_FORMAT_HPP

#include <optional>
#include <string>
#include <string_view>

namespace vertopal::util {

/**
 * Canonical form of a format name: surrounding whitespace and leading dots
 * removed, lower case. An empty result means no format.
 *   ".PDF" -> "pdf", "  HTML " -> "html", "" -> nullopt
 */
std::optional<std::string> canonicalize_format(std::string_view format);
std::optional<std::string> canonicalize_format(const std::optional<std::string>& format);

inline std::optional<std::string> canonicalize_format(const std::string& format) {
    return canonicalize_format(std::string_view(format));
}

inline std::optional<std::string> canonicalize_format(const char* format) {
    return canonicalize_format(std::string_view(format));
}

}

#endif
