#include "http_response.hpp"
#include "../../util/logger.hpp"

namespace vertopal::http{

    void http_response::append_content(const char* data, size_t size){
        content_.append(data, size);
    }

    void http_response::set_status(uint16_t status_code){
        status_ = status_code;
    }

    void http_response::set_reason_phrase(const std::string& reason){
        reason_phrase_ = reason;
    }

    const std::string& http_response::get_content() const{
        return content_;
    }

    size_t http_response::get_content_size() const{
        return content_.size();
    }

    int http_response::get_status_code() const{
        return status_;
    }

    const std::string& http_response::get_reason_phrase() const{
        return reason_phrase_;
    }

    void http_response::log(const char* scope) const{
        LOG_DEBUG("[{}] HTTP/{}.{} {} {}", scope, get_http_version_major(), get_http_version_minor(),
                  status_, reason_phrase_);
        headers::log(scope);

        // log body if present (at trace level)
        if(!content_.empty()){
            LOG_TRACE("Body: {} bytes", content_.size());
            // limit body output to avoid flooding logs
            if(content_.size() <= 500) {
                LOG_TRACE("  {}", content_);
            } else {
                LOG_TRACE("  {} (truncated)", content_.substr(0, 500));
            }
        }
    }

}
