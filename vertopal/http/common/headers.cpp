#include "headers.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "../../util/logger.hpp"

namespace vertopal::http{

    void headers::process_header(std::string key, std::string value){
        if(is_header(key, header::connection)){
            std::vector<std::string> strs;
            boost::split(strs, value, boost::is_any_of(","));
            for(auto& str:strs){
                boost::algorithm::trim(str);
                if(is_header(str, connection::keep_alive)){
                    keep_alive_ = true;
                }
                else if (is_header(str, connection::close)){
                    keep_alive_ = false;
                }
            }
        }
        else if(is_header(key, header::content_length)){
            try{
                content_length_ = boost::lexical_cast<size_t>(boost::algorithm::trim_copy(value));
                has_content_length_ = true;
            }catch(const boost::bad_lexical_cast &)
            {
                content_length_ = 0;
                has_content_length_ = false;
            }
        }
        else if(is_header(key, header::transfer_encoding)){
            // chunked must be the final coding when present
            chunked_ = boost::iends_with(boost::algorithm::trim_copy(value), "chunked");
        }

        headers_.emplace_back(std::move(key), std::move(value));
    }

    void headers::add_header(std::string key, std::string value){
        if(key.empty()) return;
        headers_.emplace_back(std::move(key), std::move(value));
    }

    void headers::set_header(std::string key, std::string value){
        for(auto & header : headers_)
        {
            if(is_header(header.first, key)){
                header.second = std::move(value);
                return;
            }
        }
        add_header(std::move(key), std::move(value));
    }

    bool headers::remove_header(std::string_view key)
    {
        for(auto it=headers_.begin(); it!=headers_.end(); ++it){
            if(is_header(it->first, key)){
                headers_.erase(it);
                return true;
            }
        }
        return false;
    }

    bool headers::has_header(std::string_view key) const{
        for(const auto & header : headers_)
        {
            if(is_header(header.first, key)){
                return true;
            }
        }
        return false;
    }

    const std::string& headers::get_header(std::string_view key) const
    {
        for(const auto & header : headers_)
        {
            if(is_header(header.first, key)){
                return header.second;
            }
        }
        static const std::string empty;
        return empty;
    }

    const std::vector<headers::http_header>& headers::get_headers() const{
        return headers_;
    }

    bool headers::empty_headers() const{
        return headers_.empty();
    }

    const std::string& headers::get_content_type() const
    {
        return get_header(header::content_type);
    }

    bool headers::is_content_type(std::string_view value) const
    {
        return boost::icontains(get_header(header::content_type), value);
    }

    size_t headers::get_content_length() const{
        return content_length_;
    }

    bool headers::has_content_length() const{
        return has_content_length_;
    }

    bool headers::is_chunked() const{
        return chunked_;
    }

    bool headers::keep_alive() const
    {
        if(boost::indeterminate(keep_alive_)){
            return http_version_major_>=1 && http_version_minor_>=1;
        }
        return static_cast<bool>(keep_alive_);
    }

    void headers::set_http_version_major(uint8_t http_version_major) {
        http_version_major_ = http_version_major;
    }

    void headers::set_http_version_minor(uint8_t http_version_minor) {
        http_version_minor_ = http_version_minor;
    }

    int headers::get_http_version_major() const {
        return http_version_major_;
    }

    int headers::get_http_version_minor() const {
        return http_version_minor_;
    }

    void headers::log(const char* scope) const{
        LOG_DEBUG("[{}] Headers:", scope);
        for(const auto& t: headers_){
            // never leak credentials into logs
            if(is_header(t.first, header::authorization)){
                LOG_DEBUG("  {}: <redacted>", t.first);
            }else{
                LOG_DEBUG("  {}: {}", t.first, t.second);
            }
        }
    }

    bool headers::is_header(std::string_view key, std::string_view header){
        return boost::iequals(key, header);
    }
}
