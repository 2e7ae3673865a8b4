#ifndef VERTOPAL_HTTP_HEADERS_HPP
#define VERTOPAL_HTTP_HEADERS_HPP

#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <boost/logic/tribool.hpp>

namespace vertopal::http {

    namespace header {
        constexpr std::string_view authorization       = "Authorization";
        constexpr std::string_view connection          = "Connection";
        constexpr std::string_view content_encoding    = "Content-Encoding";
        constexpr std::string_view content_length      = "Content-Length";
        constexpr std::string_view content_type        = "Content-Type";
        constexpr std::string_view host                = "Host";
        constexpr std::string_view transfer_encoding   = "Transfer-Encoding";
        constexpr std::string_view user_agent          = "User-Agent";
        constexpr std::string_view accept              = "Accept";
        constexpr std::string_view accept_encoding     = "Accept-Encoding";
    }

    namespace connection {
        constexpr std::string_view keep_alive = "keep-alive";
        constexpr std::string_view close      = "close";
    }

    namespace misc_strings {
        constexpr std::string_view name_value_separator = ": ";
        constexpr std::string_view crlf                 = "\r\n";
    }

    /**
     * Ordered, case-insensitive header collection shared by requests and
     * responses. Keeps track of the framing related headers (Content-Length,
     * Transfer-Encoding, Connection) while they are processed by a parser.
     */
    class headers {

    public:
        using http_header = std::pair<std::string, std::string>;

        headers() = default;
        virtual ~headers() = default;

        // called by parsers: also updates framing state
        void process_header(std::string key, std::string value);

        void add_header(std::string key, std::string value);
        void set_header(std::string key, std::string value);
        bool remove_header(std::string_view key);

        bool has_header(std::string_view key) const;
        const std::string& get_header(std::string_view key) const;
        const std::vector<http_header>& get_headers() const;
        bool empty_headers() const;

        const std::string& get_content_type() const;
        bool is_content_type(std::string_view value) const;

        size_t get_content_length() const;
        bool has_content_length() const;
        bool is_chunked() const;
        bool keep_alive() const;

        void set_http_version_major(uint8_t http_version_major);
        void set_http_version_minor(uint8_t http_version_minor);
        int get_http_version_major() const;
        int get_http_version_minor() const;

        void log(const char* scope) const;

        static bool is_header(std::string_view key, std::string_view header);

    protected:
        std::vector<http_header> headers_;
        size_t content_length_ = 0;
        bool has_content_length_ = false;
        bool chunked_ = false;
        boost::tribool keep_alive_ = boost::indeterminate;
        uint8_t http_version_major_ = 1;
        uint8_t http_version_minor_ = 1;
    };

}

#endif
