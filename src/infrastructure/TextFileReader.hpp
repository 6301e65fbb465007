/**
 * @file TextFileReader.hpp
 * @brief Reads plain or gzip-compressed text files as UTF-8.
 */

#pragma once
#include <filesystem>
#include <string>

namespace simboard::infrastructure {

class TextFileReader {
public:
    /**
     * @brief Reads the whole file, decompressing gzip content transparently.
     *
     * Invalid UTF-8 sequences are replaced with U+FFFD.
     * @throws domain::FileReadError if the file cannot be opened or decompressed.
     */
    static std::string ReadText(const std::filesystem::path& path);

    /** @brief Replaces every byte that is not part of a valid UTF-8 sequence with U+FFFD. */
    static std::string SanitizeUtf8(const std::string& bytes);
};

} // namespace simboard::infrastructure
