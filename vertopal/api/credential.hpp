#ifndef VERTOPAL_API_CREDENTIAL_HPP
#define VERTOPAL_API_CREDENTIAL_HPP

#include <string>
#include "../config/config.hpp"

namespace vertopal::api {

/**
 * Application id and security token pair sent with every request. Both
 * values are validated at construction and never change afterwards.
 */
class credential {
public:
    // throws std::invalid_argument when app or token is empty or blank
    credential(std::string app, std::string token);

    // built from api.app and api.token
    static credential from_config(const config& cfg = config::global());

    const std::string& app() const { return app_; }
    const std::string& token() const { return token_; }

    bool is_valid() const { return !app_.empty() && !token_.empty(); }

private:
    std::string app_;
    std::string token_;
};

}

#endif
