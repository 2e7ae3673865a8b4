#include <catch2/catch_test_macros.hpp>
#include <vertopal/util/compression.hpp>
#include "../../fixtures/compressed_payloads.hpp"

using namespace vertopal::util;
using vertopal::test::gzip_compress;
using vertopal::test::zlib_compress;

namespace {

    // decodes a whole buffer, empty when the stream is corrupt or incomplete
    std::optional<std::string> decode(inflater::format format, std::string_view data) {
        inflater decoder(format);
        std::string result;
        bool ok = decoder.feed(data, [&result](std::string_view chunk) {
            result.append(chunk);
            return true;
        });
        if (!ok || !decoder.finished()) return std::nullopt;
        return result;
    }

}

TEST_CASE("inflater decodes whole buffers", "[compression][unit]") {

    SECTION("gzip") {
        auto plain = decode(inflater::format::gzip, gzip_compress("converted document"));
        REQUIRE(plain.has_value());
        REQUIRE(*plain == "converted document");
    }

    SECTION("deflate with zlib framing") {
        auto plain = decode(inflater::format::deflate, zlib_compress("{\"result\":{}}"));
        REQUIRE(plain.has_value());
        REQUIRE(*plain == "{\"result\":{}}");
    }

    SECTION("large output spans several zlib buffers") {
        std::string text(100000, 'v');
        auto plain = decode(inflater::format::gzip, gzip_compress(text));
        REQUIRE(plain == text);
    }

    SECTION("corrupt input") {
        REQUIRE_FALSE(decode(inflater::format::gzip, "definitely not gzip").has_value());
    }

    SECTION("truncated stream") {
        auto compressed = gzip_compress(std::string(1000, 'x'));
        auto cut = compressed.substr(0, compressed.size() / 2);
        REQUIRE_FALSE(decode(inflater::format::gzip, cut).has_value());
    }
}

TEST_CASE("inflater decodes fed pieces", "[compression][unit]") {
    std::string payload;
    for (int i = 0; i < 2000; ++i) payload += std::to_string(i) + ",";
    auto compressed = gzip_compress(payload);

    inflater decoder(inflater::format::gzip);
    std::string result;
    auto collect = [&result](std::string_view chunk) {
        result.append(chunk);
        return true;
    };

    for (size_t offset = 0; offset < compressed.size(); offset += 7) {
        REQUIRE(decoder.feed(std::string_view(compressed).substr(offset, 7), collect));
    }
    REQUIRE(decoder.finished());
    REQUIRE(result == payload);

    SECTION("sink can stop decoding") {
        inflater stopper(inflater::format::gzip);
        REQUIRE_FALSE(stopper.feed(compressed, [](std::string_view) { return false; }));
    }
}

TEST_CASE("inflater encoding selection", "[compression][unit]") {
    REQUIRE(inflater::from_encoding("gzip") == inflater::format::gzip);
    REQUIRE(inflater::from_encoding("x-gzip") == inflater::format::gzip);
    REQUIRE(inflater::from_encoding("deflate") == inflater::format::deflate);
    REQUIRE_FALSE(inflater::from_encoding("br").has_value());
}
