#include "format.hpp"
#include <boost/algorithm/string.hpp>

namespace vertopal::util {

std::optional<std::string> canonicalize_format(std::string_view format) {
    std::string result(format);

    // dots and blanks may interleave at the front (" . pdf")
    boost::algorithm::trim_left_if(result, boost::is_space() || boost::is_any_of("."));
    boost::algorithm::trim_right(result);
    if (result.empty()) return std::nullopt;

    boost::algorithm::to_lower(result);
    return result;
}

std::optional<std::string> canonicalize_format(const std::optional<std::string>& format) {
    if (!format) return std::nullopt;
    return canonicalize_format(std::string_view(*format));
}

}
