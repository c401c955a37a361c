/**
 * @file text_decoder.h
 * @brief Decode-with-fallback text loading
 */

#ifndef KCENON_MEDIA_FETCH_CORE_TEXT_DECODER_H
#define KCENON_MEDIA_FETCH_CORE_TEXT_DECODER_H

#include <kcenon/media_fetch/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::media_fetch {

/**
 * @brief Decoded text together with the encoding that accepted it
 */
struct decoded_text {
    std::string text;      ///< UTF-8, without byte order mark
    std::string encoding;  ///< Encoding name that decoded the input
};

/**
 * @brief Default fallback order: UTF-8, UTF-16, CP932, ISO-8859-1
 */
[[nodiscard]] auto default_text_encodings() -> const std::vector<std::string>&;

/**
 * @brief Decode raw bytes by trying each encoding in order
 *
 * The first encoding that converts the whole input without an invalid
 * sequence wins. UTF-16 is attempted only when the input starts with a
 * UTF-16 byte order mark. A leading UTF-8 byte order mark is stripped.
 *
 * @param bytes Raw file content
 * @param encodings Ordered list of iconv encoding names
 * @return UTF-8 text, or decode_error when no encoding fits
 */
[[nodiscard]] auto decode_with_fallback(
    std::string_view bytes,
    const std::vector<std::string>& encodings = default_text_encodings())
    -> result<decoded_text>;

/**
 * @brief Read a whole file and decode it with fallback
 * @return Decoded text, file_read_error or decode_error
 */
[[nodiscard]] auto read_text_file(
    const std::filesystem::path& path,
    const std::vector<std::string>& encodings = default_text_encodings())
    -> result<decoded_text>;

/**
 * @brief Write UTF-8 text to a file, replacing its content
 */
[[nodiscard]] auto write_text_file(const std::filesystem::path& path, std::string_view text)
    -> result<void>;

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_CORE_TEXT_DECODER_H
