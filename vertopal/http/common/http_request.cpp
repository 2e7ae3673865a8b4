#include "http_request.hpp"
#include <regex>
#include <boost/algorithm/string.hpp>
#include "../../util/logger.hpp"

namespace vertopal::http{

    namespace method_strings{
        const std::string get     = "GET";
        const std::string post    = "POST";
        const std::string put     = "PUT";
        const std::string head    = "HEAD";
        const std::string unknown = "UNKNOWN";
    }

    const std::string& get_method(method m){
        switch(m){
            case method::GET:
                return method_strings::get;
            case method::POST:
                return method_strings::post;
            case method::PUT:
                return method_strings::put;
            case method::HEAD:
                return method_strings::head;
            default:
                return method_strings::unknown;
        }
    }

    method get_method(std::string_view name){
        if(boost::iequals(name, method_strings::get)) return method::GET;
        if(boost::iequals(name, method_strings::post)) return method::POST;
        if(boost::iequals(name, method_strings::put)) return method::PUT;
        if(boost::iequals(name, method_strings::head)) return method::HEAD;
        return method::UNKNOWN;
    }

    bool http_request::set_url(const std::string& url){
        // scheme://host[:port][/resource]
        static const std::regex url_regex(R"(^(https?)://([^/:?#\s]+)(?::(\d{1,5}))?([/?][^#\s]*)?(?:#.*)?$)",
                                          std::regex::icase);
        std::smatch what;
        if(!std::regex_match(url, what, url_regex)){
            LOG_ERROR("cannot parse url: {}", url);
            return false;
        }

        url_      = url;
        protocol_ = boost::algorithm::to_lower_copy(what[1].str());
        host_     = what[2].str();
        port_     = what[3].matched ? what[3].str() : (protocol_ == "https" ? "443" : "80");
        resource_ = what[4].matched ? what[4].str() : "/";
        if(resource_.front() == '?') resource_.insert(resource_.begin(), '/');
        return true;
    }

    const std::string& http_request::get_url() const{
        return url_;
    }

    const std::string& http_request::get_protocol() const{
        return protocol_;
    }

    const std::string& http_request::get_host() const{
        return host_;
    }

    const std::string& http_request::get_port() const{
        return port_;
    }

    const std::string& http_request::get_resource() const{
        return resource_;
    }

    std::string http_request::get_base_path() const{
        return protocol_ + "://" + host_ + ":" + port_;
    }

    bool http_request::is_ssl() const{
        return protocol_ == "https";
    }

    void http_request::set_method(method m){
        method_ = m;
    }

    method http_request::get_method() const{
        return method_;
    }

    void http_request::set_content(std::string content){
        content_ = std::move(content);
    }

    void http_request::set_content(std::string content, std::string content_type){
        content_ = std::move(content);
        set_header(std::string(header::content_type), std::move(content_type));
    }

    const std::string& http_request::get_body() const{
        return content_;
    }

    void http_request::to_buffer(std::vector<boost::asio::const_buffer>& buffer){
        request_line_ = http::get_method(method_) + " " + resource_ + " HTTP/1.1";

        if(!has_header(header::host)){
            bool default_port = (is_ssl() && port_ == "443") || (!is_ssl() && port_ == "80");
            add_header(std::string(header::host), default_port ? host_ : host_ + ":" + port_);
        }

        content_length_ = std::to_string(content_.size());
        if(!content_.empty() || method_ == method::POST || method_ == method::PUT){
            set_header(std::string(header::content_length), content_length_);
        }

        buffer.emplace_back(boost::asio::buffer(request_line_));
        buffer.emplace_back(boost::asio::buffer(misc_strings::crlf.data(), misc_strings::crlf.size()));
        for(const auto& t: headers_){
            buffer.emplace_back(boost::asio::buffer(t.first));
            buffer.emplace_back(boost::asio::buffer(misc_strings::name_value_separator.data(),
                                                    misc_strings::name_value_separator.size()));
            buffer.emplace_back(boost::asio::buffer(t.second));
            buffer.emplace_back(boost::asio::buffer(misc_strings::crlf.data(), misc_strings::crlf.size()));
        }
        buffer.emplace_back(boost::asio::buffer(misc_strings::crlf.data(), misc_strings::crlf.size()));
        if(!content_.empty()){
            buffer.emplace_back(boost::asio::buffer(content_));
        }
    }

    void http_request::log(const char* scope) const{
        LOG_DEBUG("[{}] {} {}", scope, http::get_method(method_), url_);
        headers::log(scope);
        if(!content_.empty()){
            LOG_TRACE("Body: {} bytes", content_.size());
        }
    }

}
