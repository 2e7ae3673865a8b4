#ifndef VERTOPAL_IO_FILE_HPP
#define VERTOPAL_IO_FILE_HPP

#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "protocols.hpp"

namespace vertopal::io {

// pull source reading a local file
class file_source : public pull_source {
public:
    explicit file_source(const std::filesystem::path& path);

    size_t read_some(char* buffer, size_t size) override;

private:
    std::filesystem::path path_;
    std::ifstream stream_;
};

// sink writing a local file, write failures raise output_write
class file_sink : public byte_sink {
public:
    file_sink(const std::filesystem::path& path, bool append, size_t buffer_size);
    ~file_sink() override;

    void write(std::string_view data) override;
    void close() override;

private:
    std::filesystem::path path_;
    std::vector<char> buffer_;
    std::ofstream stream_;
};

/**
 * Local file used as conversion input. The upload filename defaults to the
 * file name component of the path, the content type to
 * application/octet-stream.
 */
class file_input : public readable {
public:
    explicit file_input(std::filesystem::path path,
                        std::optional<std::string> filename = std::nullopt,
                        std::optional<std::string> content_type = std::nullopt);

    // raises input_not_found when the path is not a readable regular file
    std::unique_ptr<byte_source> open() override;

    std::optional<std::string> filename() const override { return filename_; }
    std::optional<std::string> content_type() const override { return content_type_; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::string filename_;
    std::string content_type_;
};

/**
 * Local file used as conversion output. The file is created (or truncated,
 * unless append is set) when open() is called, not at construction.
 */
class file_output : public path_writable {
public:
    explicit file_output(std::string path, bool append = false, size_t buffer_size = 0);

    std::unique_ptr<byte_sink> open() override;

    const std::string& path() const override { return path_; }
    void set_path(std::string path) override { path_ = std::move(path); }
    bool append() const { return append_; }

private:
    std::string path_;
    bool append_;
    size_t buffer_size_;
};

}

#endif
