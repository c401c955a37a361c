/**
 * @file text_decoder.cpp
 * @brief Implementation of decode-with-fallback on iconv
 */

#include <kcenon/media_fetch/core/text_decoder.h>

#include <iconv.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>

namespace kcenon::media_fetch {

namespace {

constexpr std::string_view utf8_bom = "\xEF\xBB\xBF";

auto has_utf16_bom(std::string_view bytes) -> bool {
    if (bytes.size() < 2) return false;
    auto b0 = static_cast<unsigned char>(bytes[0]);
    auto b1 = static_cast<unsigned char>(bytes[1]);
    return (b0 == 0xFF && b1 == 0xFE) || (b0 == 0xFE && b1 == 0xFF);
}

auto is_utf16_name(const std::string& encoding) -> bool {
    std::string upper;
    upper.reserve(encoding.size());
    for (char c : encoding) {
        if (c == '-' || c == '_') continue;
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return upper.rfind("UTF16", 0) == 0;
}

/**
 * @brief RAII wrapper over an iconv conversion descriptor
 */
class iconv_handle {
public:
    explicit iconv_handle(const std::string& from)
        : cd_(iconv_open("UTF-8", from.c_str())) {}

    ~iconv_handle() {
        if (valid()) {
            iconv_close(cd_);
        }
    }

    iconv_handle(const iconv_handle&) = delete;
    auto operator=(const iconv_handle&) -> iconv_handle& = delete;

    [[nodiscard]] auto valid() const -> bool {
        return cd_ != reinterpret_cast<iconv_t>(-1);
    }

    [[nodiscard]] auto get() const -> iconv_t { return cd_; }

private:
    iconv_t cd_;
};

// Returns nullopt when the encoding is unknown or the input is not valid in it
auto convert_to_utf8(std::string_view bytes, const std::string& encoding)
    -> std::optional<std::string> {
    iconv_handle handle(encoding);
    if (!handle.valid()) {
        return std::nullopt;
    }

    std::string output;
    std::string chunk(std::max<std::size_t>(bytes.size() * 2, 64), '\0');

    char* in_ptr = const_cast<char*>(bytes.data());
    std::size_t in_left = bytes.size();

    while (true) {
        char* out_ptr = chunk.data();
        std::size_t out_left = chunk.size();

        std::size_t rc = iconv(handle.get(),
                               in_left > 0 ? &in_ptr : nullptr,
                               in_left > 0 ? &in_left : nullptr,
                               &out_ptr, &out_left);
        output.append(chunk.data(), chunk.size() - out_left);

        if (rc != static_cast<std::size_t>(-1)) {
            if (in_left == 0) {
                break;
            }
            continue;
        }
        if (errno == E2BIG) {
            continue;
        }
        // EILSEQ or EINVAL: invalid or truncated sequence
        return std::nullopt;
    }

    return output;
}

}  // namespace

auto default_text_encodings() -> const std::vector<std::string>& {
    static const std::vector<std::string> encodings = {
        "UTF-8", "UTF-16", "CP932", "ISO-8859-1"};
    return encodings;
}

auto decode_with_fallback(std::string_view bytes, const std::vector<std::string>& encodings)
    -> result<decoded_text> {
    const bool utf16_bom = has_utf16_bom(bytes);

    for (const auto& encoding : encodings) {
        if (is_utf16_name(encoding) && !utf16_bom) {
            continue;
        }

        auto converted = convert_to_utf8(bytes, encoding);
        if (!converted) {
            continue;
        }

        std::string text = std::move(*converted);
        if (text.starts_with(utf8_bom)) {
            text.erase(0, utf8_bom.size());
        }
        return decoded_text{std::move(text), encoding};
    }

    return unexpected(error{error_code::decode_error,
                            "no encoding in the fallback list accepted the input"});
}

auto read_text_file(const std::filesystem::path& path,
                    const std::vector<std::string>& encodings) -> result<decoded_text> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::file_read_error,
                                "cannot open file: " + path.string()});
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return unexpected(error{error_code::file_read_error,
                                "read failed: " + path.string()});
    }

    auto decoded = decode_with_fallback(content.str(), encodings);
    if (!decoded) {
        return unexpected(error{error_code::decode_error,
                                decoded.error().message + ": " + path.string()});
    }
    return decoded;
}

auto write_text_file(const std::filesystem::path& path, std::string_view text)
    -> result<void> {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return unexpected(error{error_code::file_write_error,
                                "cannot open file for writing: " + path.string()});
    }

    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    file.flush();
    if (!file) {
        return unexpected(error{error_code::file_write_error,
                                "write failed: " + path.string()});
    }
    return {};
}

}  // namespace kcenon::media_fetch
