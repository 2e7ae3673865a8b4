#ifndef VERTOPAL_HTTP_REQUEST_HPP
#define VERTOPAL_HTTP_REQUEST_HPP

#include <string>
#include <string_view>
#include <vector>
#include <boost/asio/buffer.hpp>
#include "headers.hpp"

namespace vertopal::http {

    enum class method {
        GET,
        POST,
        PUT,
        HEAD,
        UNKNOWN
    };

    const std::string& get_method(method m);
    method get_method(std::string_view name);

    /**
     * Outgoing HTTP/1.1 request. The absolute URL is split on set_url into
     * scheme, host, port and resource so the connection layer can reach the
     * origin directly.
     */
    class http_request : public headers {

    public:
        http_request() = default;
        ~http_request() override = default;

        // url handling; returns false when the url cannot be parsed
        bool set_url(const std::string& url);
        const std::string& get_url() const;
        const std::string& get_protocol() const;
        const std::string& get_host() const;
        const std::string& get_port() const;
        const std::string& get_resource() const;
        std::string get_base_path() const;
        bool is_ssl() const;

        // method
        void set_method(method m);
        method get_method() const;

        // body
        void set_content(std::string content);
        void set_content(std::string content, std::string content_type);
        const std::string& get_body() const;

        // serialization: request line, headers, Host and Content-Length, body
        void to_buffer(std::vector<boost::asio::const_buffer>& buffer);

        void log(const char* scope) const;

    private:
        method method_ = method::GET;
        std::string url_;
        std::string protocol_;
        std::string host_;
        std::string port_;
        std::string resource_ = "/";
        std::string content_;

        // storage for generated fragments referenced by to_buffer
        std::string request_line_;
        std::string content_length_;
    };

}

#endif
