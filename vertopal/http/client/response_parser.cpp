#include "response_parser.hpp"
#include "../common/http_response.hpp"
#include "../../util/logger.hpp"

#include <algorithm>

namespace vertopal::http {

    boost::tribool response_parser::parse(const uint8_t* begin, const uint8_t* end, bool head_request) {
        while (begin != end) {
            // batch process content bytes instead of consuming them one by one
            if ((state_ == length_delimited_content || state_ == chunked_content) && temp_int_ > 0) {
                size_t available = static_cast<size_t>(end - begin);
                size_t to_read = std::min(available, temp_int_);
                if (!on_content(reinterpret_cast<const char*>(begin), to_read)) {
                    return false;
                }
                begin += to_read;
                temp_int_ -= to_read;

                if (temp_int_ == 0) {
                    if (state_ == length_delimited_content) return true;
                    state_ = chunked_content_expecting_r;
                }
                continue;
            }

            if (state_ == until_close_content) {
                size_t available = static_cast<size_t>(end - begin);
                if (!on_content(reinterpret_cast<const char*>(begin), available)) {
                    return false;
                }
                return boost::indeterminate;
            }

            boost::tribool result = consume(static_cast<char>(*begin++), head_request);
            if (result || !result) {
                return result;
            }
        }
        return boost::indeterminate;
    }

    bool response_parser::on_eof() {
        if (state_ == until_close_content) {
            state_ = http_version_h;
            return true;
        }
        return false;
    }

    std::shared_ptr<http_response> response_parser::consume_response() {
        auto response = std::move(resp_);
        reset();
        return response;
    }

    void response_parser::reset() {
        resp_.reset();
        temp_string1_.clear();
        temp_string2_.clear();
        temp_int_ = 0;
        headers_size_ = 0;
        content_read_ = 0;
        headers_complete_ = false;
        last_chunk_ = false;
        framing_ = body_framing::none;
        state_ = http_version_h;
    }

    int response_parser::get_status_code() const {
        return resp_ ? resp_->get_status_code() : 0;
    }

    bool response_parser::headers_complete() const {
        return headers_complete_;
    }

    size_t response_parser::get_content_read() const {
        return content_read_;
    }

    void response_parser::set_on_headers(headers_callback callback) {
        on_headers_ = std::move(callback);
    }

    void response_parser::set_on_body(body_callback callback) {
        on_body_ = std::move(callback);
    }

    bool response_parser::on_content(const char* data, size_t size) {
        if (size == 0) return true;
        content_read_ += size;
        if (on_body_) {
            return on_body_(std::string_view(data, size));
        }
        if (resp_->get_content_size() + size > MAX_CONTENT_SIZE) {
            LOG_ERROR("response body exceeds {} bytes", MAX_CONTENT_SIZE);
            return false;
        }
        resp_->append_content(data, size);
        return true;
    }

    boost::tribool response_parser::on_headers_end(bool head_request) {
        headers_complete_ = true;

        if (on_headers_ && !on_headers_(*resp_)) {
            return false;
        }

        int status = resp_->get_status_code();
        // responses that never carry a body
        if (head_request || (status >= 100 && status < 200) || status == 204 || status == 304) {
            framing_ = body_framing::none;
            return true;
        }

        if (resp_->is_chunked()) {
            framing_ = body_framing::chunked;
            temp_string1_.clear();
            state_ = chunked_content_size;
            return boost::indeterminate;
        }

        if (resp_->has_content_length()) {
            framing_ = body_framing::length_delimited;
            temp_int_ = resp_->get_content_length();
            if (temp_int_ == 0) return true;
            if (!on_body_ && temp_int_ > MAX_CONTENT_SIZE) {
                LOG_ERROR("response content length {} exceeds {} bytes", temp_int_, MAX_CONTENT_SIZE);
                return false;
            }
            state_ = length_delimited_content;
            return boost::indeterminate;
        }

        framing_ = body_framing::until_close;
        state_ = until_close_content;
        return boost::indeterminate;
    }

    boost::tribool response_parser::consume(char input, bool head_request) {
        if (!headers_complete_ && ++headers_size_ > MAX_HEADERS_SIZE) {
            LOG_ERROR("response headers exceed {} bytes", MAX_HEADERS_SIZE);
            return false;
        }

        switch (state_) {
            case http_version_h:
                if (input == 'H') {
                    resp_ = std::make_shared<http_response>();
                    state_ = http_version_t_1;
                    return boost::indeterminate;
                }
                return false;
            case http_version_t_1:
                if (input == 'T') {
                    state_ = http_version_t_2;
                    return boost::indeterminate;
                }
                return false;
            case http_version_t_2:
                if (input == 'T') {
                    state_ = http_version_p;
                    return boost::indeterminate;
                }
                return false;
            case http_version_p:
                if (input == 'P') {
                    state_ = http_version_slash;
                    return boost::indeterminate;
                }
                return false;
            case http_version_slash:
                if (input == '/') {
                    state_ = http_version_major_start;
                    return boost::indeterminate;
                }
                return false;
            case http_version_major_start:
                if (is_digit(input)) {
                    resp_->set_http_version_major(static_cast<uint8_t>(input - '0'));
                    state_ = http_version_major;
                    return boost::indeterminate;
                }
                return false;
            case http_version_major:
                if (input == '.') {
                    state_ = http_version_minor_start;
                    return boost::indeterminate;
                }
                return false;
            case http_version_minor_start:
                if (is_digit(input)) {
                    resp_->set_http_version_minor(static_cast<uint8_t>(input - '0'));
                    state_ = http_version_minor;
                    return boost::indeterminate;
                }
                return false;
            case http_version_minor:
                if (input == ' ') {
                    temp_int_ = 0;
                    temp_string1_.clear();
                    state_ = status_code;
                    return boost::indeterminate;
                }
                return false;
            case status_code:
                if (is_digit(input)) {
                    temp_string1_.push_back(input);
                    if (temp_string1_.size() > 3) return false;
                    temp_int_ = temp_int_ * 10 + static_cast<size_t>(input - '0');
                    return boost::indeterminate;
                }
                if (input == ' ' && temp_string1_.size() == 3) {
                    resp_->set_status(static_cast<uint16_t>(temp_int_));
                    temp_int_ = 0;
                    temp_string1_.clear();
                    state_ = reason_phrase;
                    return boost::indeterminate;
                }
                if (input == '\r' && temp_string1_.size() == 3) {
                    // empty reason phrase without separator
                    resp_->set_status(static_cast<uint16_t>(temp_int_));
                    temp_int_ = 0;
                    temp_string1_.clear();
                    state_ = expecting_newline_1;
                    return boost::indeterminate;
                }
                return false;
            case reason_phrase:
                if (input == '\r') {
                    resp_->set_reason_phrase(temp_string1_);
                    temp_string1_.clear();
                    state_ = expecting_newline_1;
                    return boost::indeterminate;
                }
                if (is_ctl(input)) {
                    return false;
                }
                temp_string1_.push_back(input);
                return boost::indeterminate;
            case expecting_newline_1:
                if (input == '\n') {
                    state_ = header_line_start;
                    return boost::indeterminate;
                }
                return false;
            case header_line_start:
                if (input == '\r') {
                    state_ = expecting_newline_3;
                    return boost::indeterminate;
                }
                if (!temp_string1_.empty() && (input == ' ' || input == '\t')) {
                    state_ = header_lws;
                    return boost::indeterminate;
                }
                if (!is_char(input) || is_ctl(input) || is_tspecial(input)) {
                    return false;
                }
                if (!temp_string1_.empty()) {
                    resp_->process_header(std::move(temp_string1_), std::move(temp_string2_));
                    temp_string1_.clear();
                    temp_string2_.clear();
                }
                temp_string1_.push_back(input);
                state_ = header_name;
                return boost::indeterminate;
            case header_lws:
                if (input == '\r') {
                    state_ = expecting_newline_2;
                    return boost::indeterminate;
                }
                if (input == ' ' || input == '\t') {
                    return boost::indeterminate;
                }
                if (is_ctl(input)) {
                    return false;
                }
                // folded header line continues the previous value
                state_ = header_value;
                temp_string2_.push_back(' ');
                temp_string2_.push_back(input);
                return boost::indeterminate;
            case header_name:
                if (input == ':') {
                    state_ = space_before_header_value;
                    return boost::indeterminate;
                }
                if (!is_char(input) || is_ctl(input) || is_tspecial(input)) {
                    return false;
                }
                temp_string1_.push_back(input);
                return boost::indeterminate;
            case space_before_header_value:
                if (input == ' ' || input == '\t') {
                    return boost::indeterminate;
                }
                if (input == '\r') {
                    state_ = expecting_newline_2;
                    return boost::indeterminate;
                }
                if (is_ctl(input)) {
                    return false;
                }
                temp_string2_.push_back(input);
                state_ = header_value;
                return boost::indeterminate;
            case header_value:
                if (input == '\r') {
                    state_ = expecting_newline_2;
                    return boost::indeterminate;
                }
                if (is_ctl(input) && input != '\t') {
                    return false;
                }
                temp_string2_.push_back(input);
                return boost::indeterminate;
            case expecting_newline_2:
                if (input == '\n') {
                    state_ = header_line_start;
                    return boost::indeterminate;
                }
                return false;
            case expecting_newline_3:
                if (input != '\n') {
                    return false;
                }
                if (!temp_string1_.empty()) {
                    resp_->process_header(std::move(temp_string1_), std::move(temp_string2_));
                    temp_string1_.clear();
                    temp_string2_.clear();
                }
                return on_headers_end(head_request);
            case chunked_content_size:
                if (hex_value(input) >= 0) {
                    if (temp_string1_.size() >= 15) return false;
                    temp_string1_.push_back(input);
                    return boost::indeterminate;
                }
                if (input == ';' || input == ' ' || input == '\t') {
                    state_ = chunked_content_extension;
                    return boost::indeterminate;
                }
                if (input == '\r' && !temp_string1_.empty()) {
                    state_ = chunked_content_size_expecting_n;
                    return boost::indeterminate;
                }
                return false;
            case chunked_content_extension:
                // chunk extensions are ignored
                if (input == '\r' && !temp_string1_.empty()) {
                    state_ = chunked_content_size_expecting_n;
                }
                return boost::indeterminate;
            case chunked_content_size_expecting_n:
                if (input != '\n') {
                    return false;
                }
                temp_int_ = 0;
                for (char c : temp_string1_) {
                    temp_int_ = temp_int_ * 16 + static_cast<size_t>(hex_value(c));
                }
                temp_string1_.clear();
                if (temp_int_ == 0) {
                    last_chunk_ = true;
                    state_ = chunked_trailer_line_start;
                    return boost::indeterminate;
                }
                if (!on_body_ && resp_->get_content_size() + temp_int_ > MAX_CONTENT_SIZE) {
                    LOG_ERROR("chunked response body exceeds {} bytes", MAX_CONTENT_SIZE);
                    return false;
                }
                state_ = chunked_content;
                return boost::indeterminate;
            case chunked_content:
                // only reached for empty remainder, handled by the batch path in parse
                state_ = chunked_content_expecting_r;
                return consume(input, head_request);
            case chunked_content_expecting_r:
                if (input == '\r') {
                    state_ = chunked_content_expecting_n;
                    return boost::indeterminate;
                }
                return false;
            case chunked_content_expecting_n:
                if (input == '\n') {
                    state_ = chunked_content_size;
                    return boost::indeterminate;
                }
                return false;
            case chunked_trailer_line_start:
                if (input == '\r') {
                    state_ = chunked_end_expecting_n;
                    return boost::indeterminate;
                }
                state_ = chunked_trailer_line;
                return boost::indeterminate;
            case chunked_trailer_line:
                if (input == '\r') {
                    state_ = chunked_trailer_expecting_n;
                }
                return boost::indeterminate;
            case chunked_trailer_expecting_n:
                if (input == '\n') {
                    state_ = chunked_trailer_line_start;
                    return boost::indeterminate;
                }
                return false;
            case chunked_end_expecting_n:
                return input == '\n';
            default:
                return false;
        }
    }

    bool response_parser::is_char(int c) {
        return c >= 0 && c <= 127;
    }

    bool response_parser::is_ctl(int c) {
        return (c >= 0 && c <= 31) || (c == 127);
    }

    bool response_parser::is_tspecial(int c) {
        switch (c) {
            case '(': case ')': case '<': case '>': case '@':
            case ',': case ';': case ':': case '\\': case '"':
            case '/': case '[': case ']': case '?': case '=':
            case '{': case '}': case ' ': case '\t':
                return true;
            default:
                return false;
        }
    }

    bool response_parser::is_digit(int c) {
        return c >= '0' && c <= '9';
    }

    int response_parser::hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

}
