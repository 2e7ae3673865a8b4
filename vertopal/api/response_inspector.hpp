#ifndef VERTOPAL_API_RESPONSE_INSPECTOR_HPP
#define VERTOPAL_API_RESPONSE_INSPECTOR_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vertopal::api {

// error or warning record reported by the service
struct service_notice {
    std::optional<std::string> code;
    std::optional<std::string> message;

    bool empty() const { return !code && !message; }
};

/**
 * Reads error and warning records out of a decoded response envelope.
 *
 * Errors are looked up at the envelope root, "error", "result.error" and
 * "result.output.result.error", in that order, and the first object holding
 * a non-empty "code" or "message" wins. Warnings are collected from every
 * path among "warning", "result.warning", "result.output.warning" and
 * "result.output.result.warning".
 *
 * A missing key or a non-object value along a path just means the path does
 * not match.
 */
class response_inspector {
public:
    static bool has_error(const nlohmann::json& envelope);
    static service_notice get_error(const nlohmann::json& envelope);

    static bool has_warning(const nlohmann::json& envelope);
    static std::vector<service_notice> get_warnings(const nlohmann::json& envelope);

    /**
     * Throws the api_error mapped from the error code when the envelope holds
     * an error. Warnings are only logged.
     */
    static void raise_for_response(const nlohmann::json& envelope);

private:
    static const nlohmann::json* resolve(const nlohmann::json& envelope,
                                         const std::vector<const char*>& path);
    static const nlohmann::json* match(const nlohmann::json& envelope,
                                       const std::vector<const char*>& path);
    static service_notice to_notice(const nlohmann::json& record);
};

}

#endif
