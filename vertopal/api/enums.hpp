#ifndef VERTOPAL_API_ENUMS_HPP
#define VERTOPAL_API_ENUMS_HPP

#include <string_view>

namespace vertopal::api {

    // how the service runs a conversion task
    enum class strategy_mode {
        async,
        sync
    };

    // which side of the format graph convert_formats lists
    enum class sublist_mode {
        inputs,
        outputs
    };

    constexpr std::string_view to_string(strategy_mode mode) {
        return mode == strategy_mode::sync ? "sync" : "async";
    }

    constexpr std::string_view to_string(sublist_mode mode) {
        return mode == sublist_mode::outputs ? "outputs" : "inputs";
    }

}

#endif
