/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>

namespace kcenon::media_fetch::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

auto test_data_generator::generate_subtitle_text(std::size_t lines, uint32_t seed)
    -> std::string {
    static const std::vector<std::string> fragments = {
        "Kirito", "Asuna", "Wh-what", "Th-that's", "I-it's", "fine", "we", "should",
        "go", "now", "(laughs)", "Mr. Agil", "the", "floor", "boss", "is", "here",
        "\\N", "\\h", "Klein's", "sword", "A-are", "you", "sure?"};

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<std::size_t> word_dis(0, fragments.size() - 1);
    std::uniform_int_distribution<int> length_dis(4, 14);

    std::string text = "[Events]\n";
    for (std::size_t i = 0; i < lines; ++i) {
        text += "Dialogue: 0,0:00:01.00,0:00:03.00,Default,,0,0,0,,";
        const int words = length_dis(gen);
        for (int w = 0; w < words; ++w) {
            if (w > 0) text += ' ';
            text += fragments[word_dis(gen)];
        }
        text += '\n';
    }
    return text;
}

// temp_file_manager implementation

temp_file_manager::temp_file_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() / "media_fetch_benchmarks";
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
        owns_dir_ = false;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    cleanup();
}

auto temp_file_manager::create_file(
    const std::string& name,
    const std::vector<std::byte>& data) -> std::filesystem::path {
    auto path = base_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    created_files_.push_back(path);
    return path;
}

auto temp_file_manager::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

void temp_file_manager::cleanup() {
    std::error_code ec;

    for (const auto& path : created_files_) {
        std::filesystem::remove(path, ec);
    }
    created_files_.clear();

    if (owns_dir_) {
        std::filesystem::remove_all(base_dir_, ec);
    }
}

}  // namespace kcenon::media_fetch::benchmark
