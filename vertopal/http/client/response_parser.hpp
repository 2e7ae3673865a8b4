#ifndef VERTOPAL_HTTP_RESPONSE_PARSER_HPP
#define VERTOPAL_HTTP_RESPONSE_PARSER_HPP

#include <memory>
#include <functional>
#include <string>
#include <string_view>
#include <boost/logic/tribool.hpp>

namespace vertopal::http {

    class http_response;

    /// Incremental parser for HTTP/1.x responses.
    class response_parser {
    public:
        /// Limits applied while reading
        static constexpr size_t MAX_CONTENT_SIZE = 64*1048576;   // 64MB buffered bodies
        static constexpr size_t MAX_HEADERS_SIZE = 16*1024;      // 16KB

        /// Called once the status line and headers are complete. Return false to abort.
        using headers_callback = std::function<bool(const http_response&)>;

        /// Called with body bytes as they arrive. Return false to abort.
        using body_callback = std::function<bool(std::string_view)>;

        response_parser() = default;

        /// Parse some data. The tribool return value is true when a complete response
        /// has been parsed, false if the data is invalid (or a callback aborted),
        /// indeterminate when more data is required.
        boost::tribool parse(const uint8_t* begin, const uint8_t* end, bool head_request = false);

        /// Notify the peer closed the connection. Completes responses delimited by
        /// connection close; returns false if the response was truncated.
        bool on_eof();

        std::shared_ptr<http_response> consume_response();
        void reset();

        /// Available once headers are parsed
        int get_status_code() const;
        bool headers_complete() const;
        size_t get_content_read() const;

        void set_on_headers(headers_callback callback);

        /// When set, body bytes are not kept in the response but forwarded here.
        void set_on_body(body_callback callback);

        bool is_streaming() const { return static_cast<bool>(on_body_); }

    private:
        enum class body_framing {
            none,
            length_delimited,
            chunked,
            until_close
        };

        /// Handle the next character of input.
        boost::tribool consume(char input, bool head_request);

        /// Decide how the body is delimited once headers are complete
        boost::tribool on_headers_end(bool head_request);

        /// Store or forward body bytes
        bool on_content(const char* data, size_t size);

        static bool is_char(int c);
        static bool is_ctl(int c);
        static bool is_tspecial(int c);
        static bool is_digit(int c);
        static int hex_value(char c);

        std::shared_ptr<http_response> resp_;

        std::string temp_string1_;
        std::string temp_string2_;
        size_t temp_int_        = 0;
        size_t headers_size_    = 0;
        size_t content_read_    = 0;
        bool headers_complete_  = false;
        bool last_chunk_        = false;
        headers_callback on_headers_;
        body_callback on_body_;
        body_framing framing_   = body_framing::none;

        /// The current state of the parser.
        enum state {
            http_version_h,
            http_version_t_1,
            http_version_t_2,
            http_version_p,
            http_version_slash,
            http_version_major_start,
            http_version_major,
            http_version_minor_start,
            http_version_minor,
            status_code,
            reason_phrase,
            expecting_newline_1,
            header_line_start,
            header_lws,
            header_name,
            space_before_header_value,
            header_value,
            expecting_newline_2,
            expecting_newline_3,
            length_delimited_content,
            until_close_content,
            chunked_content_size,
            chunked_content_extension,
            chunked_content_size_expecting_n,
            chunked_content,
            chunked_content_expecting_r,
            chunked_content_expecting_n,
            chunked_trailer_line_start,
            chunked_trailer_line,
            chunked_trailer_expecting_n,
            chunked_end_expecting_n
        } state_ = http_version_h;
    };

}

#endif
