#include "form.hpp"
#include <iomanip>
#include <random>
#include <sstream>
#include <cctype>

namespace vertopal::http {

form& form::field(std::string name, std::string value) {
    fields_.emplace_back(std::move(name), std::move(value));
    return *this;
}

form& form::file(std::string name, std::string content,
                 std::string filename, std::string content_type) {
    files_.push_back({
        std::move(name),
        std::move(filename),
        std::move(content_type),
        std::move(content)
    });
    return *this;
}

std::string form::content_type() const {
    if (is_multipart()) {
        return "multipart/form-data; boundary=" + get_boundary();
    }
    return "application/x-www-form-urlencoded";
}

std::string form::body() const {
    return is_multipart() ? build_multipart() : build_urlencoded();
}

std::string form::build_urlencoded() const {
    std::string result;
    for (const auto& [name, value] : fields_) {
        if (!result.empty()) result += '&';
        result += url_encode(name) + '=' + url_encode(value);
    }
    return result;
}

std::string form::build_multipart() const {
    const std::string& boundary = get_boundary();

    size_t reserve = 64;
    for (const auto& file : files_) reserve += file.content.size() + 256;
    std::string out;
    out.reserve(reserve);

    for (const auto& [name, value] : fields_) {
        out += "--" + boundary + "\r\n";
        out += "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
        out += value;
        out += "\r\n";
    }

    for (const auto& file : files_) {
        out += "--" + boundary + "\r\n";
        out += "Content-Disposition: form-data; name=\"" + file.name + "\"; filename=\"" + file.filename + "\"\r\n";
        out += "Content-Type: " + file.content_type + "\r\n\r\n";
        out += file.content;
        out += "\r\n";
    }

    out += "--" + boundary + "--\r\n";
    return out;
}

const std::string& form::get_boundary() const {
    if (boundary_.empty()) {
        boundary_ = generate_boundary();
    }
    return boundary_;
}

std::string form::generate_boundary() {
    static const char chars[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, sizeof(chars) - 2);

    std::string boundary = "----VertopalFormBoundary";
    for (int i = 0; i < 16; ++i) {
        boundary += chars[dis(gen)];
    }
    return boundary;
}

std::string form::url_encode(const std::string& str) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;

    for (unsigned char c : str) {
        // RFC 3986 unreserved characters
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else if (c == ' ') {
            oss << '+';
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

} // namespace vertopal::http
