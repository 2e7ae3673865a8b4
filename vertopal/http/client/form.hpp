#ifndef VERTOPAL_HTTP_CLIENT_FORM_HPP
#define VERTOPAL_HTTP_CLIENT_FORM_HPP

#include <string>
#include <vector>
#include <utility>

namespace vertopal::http {

/**
 * Form body builder for POST requests.
 * Text-only forms are URL-encoded, forms holding a file part switch to
 * multipart/form-data.
 *
 * Usage:
 *   http::form form;
 *   form.field("data", R"({"app":"free"})")
 *       .file("file", bytes, "document.pdf");
 *   request->set_content(form.body(), form.content_type());
 */
class form {
public:
    form() = default;

    /**
     * Add a text field to the form.
     */
    form& field(std::string name, std::string value);

    /**
     * Add a file part from an in-memory buffer.
     */
    form& file(std::string name, std::string content,
               std::string filename,
               std::string content_type = "application/octet-stream");

    /**
     * Force multipart/form-data even when the form only has text fields.
     */
    form& multipart(bool enabled) { multipart_ = enabled; return *this; }

    bool is_multipart() const { return multipart_ || !files_.empty(); }
    bool empty() const { return fields_.empty() && files_.empty(); }

    /**
     * Content-Type header value matching body(). The multipart boundary is
     * generated once per form.
     */
    std::string content_type() const;

    std::string body() const;

    static std::string url_encode(const std::string& str);

private:
    struct file_entry {
        std::string name;           // form field name
        std::string filename;
        std::string content_type;
        std::string content;
    };

    std::vector<std::pair<std::string, std::string>> fields_;
    std::vector<file_entry> files_;
    mutable std::string boundary_;
    bool multipart_ = false;

    std::string build_urlencoded() const;
    std::string build_multipart() const;
    const std::string& get_boundary() const;
    static std::string generate_boundary();
};

} // namespace vertopal::http

#endif
