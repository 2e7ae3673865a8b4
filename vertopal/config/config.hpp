#ifndef VERTOPAL_CONFIG_HPP
#define VERTOPAL_CONFIG_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace vertopal {

/**
 * Sectioned key/value configuration. Lookups resolve the override layer
 * first, then the built-in defaults, then the caller supplied fallback.
 *
 * Usage:
 *   vertopal::config cfg;
 *   cfg.update({{"api", {{"app", "my-app"}, {"token", "secret"}}}});
 *   auto retries = cfg.get<int>("connectionSettings", "retries", 3);
 *
 * config::global() is a single process-wide instance. Writes to it are not
 * synchronized.
 */
class config {
public:
    config();

    // raw lookup, returns fallback when the key is not set in any layer
    nlohmann::json get(std::string_view section, std::string_view key,
                       const nlohmann::json& fallback = nullptr) const;

    template<typename T>
    T get(std::string_view section, std::string_view key, T fallback) const {
        auto value = get(section, key, nlohmann::json(nullptr));
        if (value.is_null()) return fallback;
        try {
            return value.get<T>();
        } catch (const nlohmann::json::exception&) {
            return fallback;
        }
    }

    bool has(std::string_view section, std::string_view key) const;

    // merges overrides per section, {"api": {"app": "x"}} only replaces api.app
    void update(const nlohmann::json& overrides);
    void set(std::string_view section, std::string_view key, nlohmann::json value);
    void clear_overrides();

    // reads a JSON object file and merges it as overrides
    void load_file(const std::filesystem::path& path);

    const nlohmann::json& overrides() const { return overrides_; }
    static const nlohmann::json& defaults();

    static config& global();

private:
    static const nlohmann::json* lookup(const nlohmann::json& layer,
                                        std::string_view section, std::string_view key);

    nlohmann::json overrides_;
};

}

#endif
