#include "response_inspector.hpp"
#include "errors.hpp"
#include "../util/logger.hpp"

namespace vertopal::api {

namespace {

    const std::vector<std::vector<const char*>> error_paths{
        {},
        {"error"},
        {"result", "error"},
        {"result", "output", "result", "error"},
    };

    const std::vector<std::vector<const char*>> warning_paths{
        {"warning"},
        {"result", "warning"},
        {"result", "output", "warning"},
        {"result", "output", "result", "warning"},
    };

    bool truthy(const nlohmann::json& value) {
        switch (value.type()) {
            case nlohmann::json::value_t::null:
            case nlohmann::json::value_t::discarded:
                return false;
            case nlohmann::json::value_t::boolean:
                return value.get<bool>();
            case nlohmann::json::value_t::string:
                return !value.get_ref<const std::string&>().empty();
            case nlohmann::json::value_t::number_integer:
            case nlohmann::json::value_t::number_unsigned:
            case nlohmann::json::value_t::number_float:
                return value.get<double>() != 0;
            default:
                return true;
        }
    }

    std::optional<std::string> field_text(const nlohmann::json& record, const char* key) {
        auto it = record.find(key);
        if (it == record.end() || it->is_null()) return std::nullopt;
        if (it->is_string()) return it->get<std::string>();
        return it->dump();
    }

}

const nlohmann::json* response_inspector::resolve(const nlohmann::json& envelope,
                                                  const std::vector<const char*>& path) {
    const nlohmann::json* node = &envelope;
    for (const char* key : path) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(key);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

const nlohmann::json* response_inspector::match(const nlohmann::json& envelope,
                                                const std::vector<const char*>& path) {
    auto node = resolve(envelope, path);
    if (!node || !node->is_object()) return nullptr;

    auto code = node->find("code");
    auto message = node->find("message");
    bool has_code = code != node->end() && truthy(*code);
    bool has_message = message != node->end() && truthy(*message);
    return has_code || has_message ? node : nullptr;
}

service_notice response_inspector::to_notice(const nlohmann::json& record) {
    return service_notice{field_text(record, "code"), field_text(record, "message")};
}

bool response_inspector::has_error(const nlohmann::json& envelope) {
    for (const auto& path : error_paths) {
        if (match(envelope, path)) return true;
    }
    return false;
}

service_notice response_inspector::get_error(const nlohmann::json& envelope) {
    for (const auto& path : error_paths) {
        if (auto record = match(envelope, path)) return to_notice(*record);
    }
    return {};
}

bool response_inspector::has_warning(const nlohmann::json& envelope) {
    for (const auto& path : warning_paths) {
        if (match(envelope, path)) return true;
    }
    return false;
}

std::vector<service_notice> response_inspector::get_warnings(const nlohmann::json& envelope) {
    std::vector<service_notice> warnings;
    for (const auto& path : warning_paths) {
        if (auto record = match(envelope, path)) warnings.push_back(to_notice(*record));
    }
    return warnings;
}

void response_inspector::raise_for_response(const nlohmann::json& envelope) {
    if (has_error(envelope)) {
        auto error = get_error(envelope);
        auto exception = api_error::from_service(error.code.value_or(""), error.message.value_or(""));
        LOG_DEBUG("service reported error: {}", exception.what());
        throw exception;
    }

    for (const auto& warning : get_warnings(envelope)) {
        LOG_WARNING("service warning [{}] {}",
                    warning.code.value_or("UNKNOWN_WARNING"),
                    warning.message.value_or(""));
    }
}

}
