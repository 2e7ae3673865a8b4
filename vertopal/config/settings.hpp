#ifndef VERTOPAL_CONFIG_SETTINGS_HPP
#define VERTOPAL_CONFIG_SETTINGS_HPP

#include <array>
#include <string_view>

namespace vertopal::settings {

    constexpr std::string_view USER_AGENT_LIB = "VertopalCppLib";
    constexpr std::string_view LIBRARY_VERSION = "1.0.0";

    // default polling pattern (seconds) used by conversion::wait
    constexpr std::array<double, 3> SLEEP_PATTERN{10, 10, 15};

    // section and key names
    namespace section {
        constexpr std::string_view api                 = "api";
        constexpr std::string_view connection_settings = "connectionSettings";
    }

    namespace key {
        constexpr std::string_view app               = "app";
        constexpr std::string_view token             = "token";
        constexpr std::string_view endpoint          = "endpoint";
        constexpr std::string_view retries           = "retries";
        constexpr std::string_view default_timeout   = "defaultTimeout";
        constexpr std::string_view long_timeout      = "longTimeout";
        constexpr std::string_view stream_chunk_size = "streamChunkSize";
    }

}

#endif
