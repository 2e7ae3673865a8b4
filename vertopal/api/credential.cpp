#include "credential.hpp"
#include "../config/settings.hpp"
#include <boost/algorithm/string.hpp>
#include <stdexcept>

namespace vertopal::api {

namespace {
    bool blank(const std::string& value) {
        return boost::algorithm::all(value, boost::is_space());
    }
}

credential::credential(std::string app, std::string token)
    : app_(std::move(app)), token_(std::move(token)) {
    if (blank(app_)) {
        throw std::invalid_argument("credential app must be a non-empty string");
    }
    if (blank(token_)) {
        throw std::invalid_argument("credential token must be a non-empty string");
    }
}

credential credential::from_config(const config& cfg) {
    return credential(cfg.get<std::string>(settings::section::api, settings::key::app, ""),
                      cfg.get<std::string>(settings::section::api, settings::key::token, ""));
}

}
