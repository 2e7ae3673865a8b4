#include "config.hpp"
#include "settings.hpp"
#include "../util/logger.hpp"
#include <fstream>
#include <stdexcept>

namespace vertopal {

config::config() : overrides_(nlohmann::json::object()) {}

const nlohmann::json& config::defaults() {
    static const nlohmann::json defaults = {
        {std::string(settings::section::api), {
            {std::string(settings::key::app), "free"},
            {std::string(settings::key::token), "FREE-TOKEN"},
            {std::string(settings::key::endpoint), "https://api.vertopal.com"}
        }},
        {std::string(settings::section::connection_settings), {
            {std::string(settings::key::retries), 5},
            {std::string(settings::key::default_timeout), 30000},
            {std::string(settings::key::long_timeout), 300000},
            {std::string(settings::key::stream_chunk_size), 4096}
        }}
    };
    return defaults;
}

config& config::global() {
    static config instance;
    return instance;
}

const nlohmann::json* config::lookup(const nlohmann::json& layer,
                                     std::string_view section, std::string_view key) {
    auto sit = layer.find(std::string(section));
    if (sit == layer.end() || !sit->is_object()) return nullptr;
    auto kit = sit->find(std::string(key));
    if (kit == sit->end() || kit->is_null()) return nullptr;
    return &(*kit);
}

nlohmann::json config::get(std::string_view section, std::string_view key,
                           const nlohmann::json& fallback) const {
    if (auto value = lookup(overrides_, section, key)) return *value;
    if (auto value = lookup(defaults(), section, key)) return *value;
    return fallback;
}

bool config::has(std::string_view section, std::string_view key) const {
    return lookup(overrides_, section, key) || lookup(defaults(), section, key);
}

void config::update(const nlohmann::json& overrides) {
    if (!overrides.is_object()) {
        throw std::invalid_argument("configuration overrides must be a JSON object");
    }
    for (const auto& [section, values] : overrides.items()) {
        if (!values.is_object()) {
            throw std::invalid_argument("configuration section '" + section + "' must be a JSON object");
        }
        auto& target = overrides_[section];
        if (!target.is_object()) target = nlohmann::json::object();
        for (const auto& [key, value] : values.items()) {
            target[key] = value;
        }
    }
}

void config::set(std::string_view section, std::string_view key, nlohmann::json value) {
    update({{std::string(section), {{std::string(key), std::move(value)}}}});
}

void config::clear_overrides() {
    overrides_ = nlohmann::json::object();
}

void config::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open configuration file: " + path.string());
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("invalid configuration file " + path.string() + ": " + e.what());
    }

    update(document);
    LOG_DEBUG("loaded configuration overrides from {}", path.string());
}

}
