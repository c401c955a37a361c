/**
 * @file segment_assembler.cpp
 * @brief Implementation of segment reassembly
 */

#include <kcenon/media_fetch/core/segment_assembler.h>

#include <kcenon/media_fetch/core/checksum.h>
#include <kcenon/media_fetch/core/logging.h>

#include <fstream>

namespace kcenon::media_fetch {

namespace {

constexpr std::size_t copy_buffer_size = 256 * 1024;

}  // namespace

segment_assembler::segment_assembler(std::filesystem::path final_path,
                                     uint64_t expected_size,
                                     uint32_t total_segments)
    : final_path_(std::move(final_path)),
      expected_size_(expected_size),
      records_(total_segments) {
    staging_path_ = final_path_;
    staging_path_ += staging_suffix;
}

segment_assembler::~segment_assembler() {
    if (!finalized_) {
        discard();
    }
}

auto segment_assembler::add_segment(segment_record record) -> result<void> {
    std::lock_guard lock(mutex_);

    if (record.range.index >= records_.size()) {
        return unexpected(error{error_code::internal_error,
                                "segment index " + std::to_string(record.range.index) +
                                    " out of range"});
    }

    auto& slot = records_[record.range.index];
    if (slot) {
        return unexpected(error{error_code::internal_error,
                                "segment " + std::to_string(record.range.index) +
                                    " registered twice"});
    }

    slot = std::move(record);
    return {};
}

auto segment_assembler::is_complete() const -> bool {
    std::lock_guard lock(mutex_);
    for (const auto& slot : records_) {
        if (!slot) return false;
    }
    return true;
}

auto segment_assembler::missing_segments() const -> std::vector<uint32_t> {
    std::lock_guard lock(mutex_);

    std::vector<uint32_t> missing;
    for (uint32_t i = 0; i < records_.size(); ++i) {
        if (!records_[i]) {
            missing.push_back(i);
        }
    }
    return missing;
}

auto segment_assembler::finalize() -> result<assembly_result> {
    std::lock_guard lock(mutex_);

    for (uint32_t i = 0; i < records_.size(); ++i) {
        if (!records_[i]) {
            return unexpected(error{error_code::segment_io_error,
                                    "segment " + std::to_string(i) + " missing"});
        }
    }

    std::ofstream staging(staging_path_, std::ios::binary | std::ios::trunc);
    if (!staging) {
        return unexpected(error{error_code::file_write_error,
                                "cannot create staging file: " + staging_path_.string()});
    }

    auto fail = [&](error err) -> result<assembly_result> {
        staging.close();
        std::error_code ec;
        std::filesystem::remove(staging_path_, ec);
        return unexpected(std::move(err));
    };

    sha256_hasher hasher;
    std::vector<char> buffer(copy_buffer_size);
    uint64_t total = 0;

    for (const auto& slot : records_) {
        const auto& record = *slot;

        std::ifstream in(record.file, std::ios::binary);
        if (!in) {
            return fail(error{error_code::segment_io_error,
                              "cannot open segment file: " + record.file.string()});
        }

        uint32_t crc = 0;
        uint64_t segment_bytes = 0;
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto n = static_cast<std::size_t>(in.gcount());
            if (n == 0) break;

            auto block = std::as_bytes(std::span<const char>(buffer.data(), n));
            crc = checksum::crc32_update(crc, block);
            hasher.update(block);

            staging.write(buffer.data(), static_cast<std::streamsize>(n));
            if (!staging) {
                return fail(error{error_code::file_write_error,
                                  "write failed: " + staging_path_.string()});
            }
            segment_bytes += n;
        }
        if (in.bad()) {
            return fail(error{error_code::segment_io_error,
                              "read failed: " + record.file.string()});
        }

        if (segment_bytes != record.bytes_written) {
            return fail(error{error_code::segment_io_error,
                              "segment " + std::to_string(record.range.index) + " holds " +
                                  std::to_string(segment_bytes) + " bytes, expected " +
                                  std::to_string(record.bytes_written)});
        }
        if (crc != record.crc32) {
            return fail(error{error_code::segment_io_error,
                              "CRC32 mismatch on segment " +
                                  std::to_string(record.range.index)});
        }

        total += segment_bytes;
    }

    staging.flush();
    if (!staging) {
        return fail(error{error_code::file_write_error,
                          "flush failed: " + staging_path_.string()});
    }
    staging.close();

    if (total == 0 || total != expected_size_) {
        return fail(error{error_code::size_mismatch,
                          "local size " + std::to_string(total) + " != remote size " +
                              std::to_string(expected_size_)});
    }

    std::error_code ec;
    if (std::filesystem::exists(final_path_, ec)) {
        std::filesystem::remove(final_path_, ec);
    }

    std::filesystem::rename(staging_path_, final_path_, ec);
    if (ec) {
        return fail(error{error_code::file_write_error,
                          "cannot rename staging file: " + ec.message()});
    }

    remove_segment_files();
    finalized_ = true;

    MF_LOG_DEBUG(log_category::chunk,
                 "Reassembled " + final_path_.filename().string() + " from " +
                     std::to_string(records_.size()) + " segment(s)");

    assembly_result out;
    out.path = final_path_;
    out.bytes = total;
    out.sha256 = hasher.finalize();
    return out;
}

void segment_assembler::discard() {
    std::lock_guard lock(mutex_);
    remove_segment_files();
    std::error_code ec;
    std::filesystem::remove(staging_path_, ec);
}

void segment_assembler::remove_segment_files() {
    std::error_code ec;
    for (const auto& slot : records_) {
        if (slot) {
            std::filesystem::remove(slot->file, ec);
        }
    }
}

}  // namespace kcenon::media_fetch
