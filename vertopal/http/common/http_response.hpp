#ifndef VERTOPAL_HTTP_RESPONSE_HPP
#define VERTOPAL_HTTP_RESPONSE_HPP

#include <string>
#include "headers.hpp"

namespace vertopal::http {

class http_response : public headers {

public:

    http_response() = default;
    ~http_response() override = default;

    // some setters
    void append_content(const char* data, size_t size);
    void set_status(uint16_t status_code);
    void set_reason_phrase(const std::string& reason);

    // some getters
    const std::string& get_content() const;
    size_t get_content_size() const;
    int get_status_code() const;
    const std::string& get_reason_phrase() const;
    // log
    void log(const char* scope) const;

private:
    std::string content_;
    uint16_t status_ = 0;
    std::string reason_phrase_;
};

}

#endif
