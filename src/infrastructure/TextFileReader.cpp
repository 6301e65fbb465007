/**
 * @file TextFileReader.cpp
 * @brief Implementation of TextFileReader using zlib's gzFile API.
 */

#include "infrastructure/TextFileReader.hpp"
#include "domain/IngestionErrors.hpp"
#include <array>
#include <memory>
#include <type_traits>
#include <zlib.h>

namespace simboard::infrastructure {

namespace {

constexpr const char* kReplacementChar = "\xEF\xBF\xBD";

struct GzCloser {
    void operator()(gzFile file) const { gzclose(file); }
};

using GzHandle = std::unique_ptr<std::remove_pointer_t<gzFile>, GzCloser>;

bool IsContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

/// Length of the valid UTF-8 sequence starting at i, or 0 when it is malformed.
std::size_t ValidSequenceLength(const std::string& s, std::size_t i) {
    const auto c0 = static_cast<unsigned char>(s[i]);
    if (c0 < 0x80) return 1;

    std::size_t length = 0;
    if (c0 >= 0xC2 && c0 <= 0xDF) length = 2;
    else if (c0 >= 0xE0 && c0 <= 0xEF) length = 3;
    else if (c0 >= 0xF0 && c0 <= 0xF4) length = 4;
    else return 0;

    if (i + length > s.size()) return 0;
    for (std::size_t k = 1; k < length; ++k) {
        if (!IsContinuation(static_cast<unsigned char>(s[i + k]))) return 0;
    }

    const auto c1 = static_cast<unsigned char>(s[i + 1]);
    // Overlong encodings, UTF-16 surrogates and code points above U+10FFFF.
    if (c0 == 0xE0 && c1 < 0xA0) return 0;
    if (c0 == 0xED && c1 > 0x9F) return 0;
    if (c0 == 0xF0 && c1 < 0x90) return 0;
    if (c0 == 0xF4 && c1 > 0x8F) return 0;
    return length;
}

} // namespace

std::string TextFileReader::ReadText(const std::filesystem::path& path) {
    GzHandle file(gzopen(path.string().c_str(), "rb"));
    if (!file) {
        throw domain::FileReadError("Failed to open file: " + path.string());
    }

    std::string content;
    std::array<char, 16384> buffer{};
    while (true) {
        int n = gzread(file.get(), buffer.data(), static_cast<unsigned>(buffer.size()));
        if (n < 0) {
            int errnum = 0;
            const char* message = gzerror(file.get(), &errnum);
            throw domain::FileReadError("Failed to read " + path.string() + ": " +
                                        (message ? message : "unknown zlib error"));
        }
        if (n == 0) break;
        content.append(buffer.data(), static_cast<std::size_t>(n));
    }
    return SanitizeUtf8(content);
}

std::string TextFileReader::SanitizeUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size()) {
        std::size_t length = ValidSequenceLength(bytes, i);
        if (length == 0) {
            out += kReplacementChar;
            ++i;
        } else {
            out.append(bytes, i, length);
            i += length;
        }
    }
    return out;
}

} // namespace simboard::infrastructure
