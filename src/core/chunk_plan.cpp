/**
 * @file chunk_plan.cpp
 * @brief Implementation of segment planning
 */

#include <kcenon/media_fetch/core/chunk_plan.h>

#include <algorithm>
#include <cctype>

namespace kcenon::media_fetch {

auto plan_segments(uint64_t file_size, uint32_t chunk_count) -> std::vector<segment> {
    std::vector<segment> plan;
    if (file_size == 0) {
        return plan;
    }

    const uint64_t count = std::max<uint32_t>(chunk_count, 1);
    const uint64_t width = (file_size + count - 1) / count;

    plan.reserve(count);
    uint32_t index = 0;
    for (uint64_t start = 0; start < file_size; start += width) {
        segment seg;
        seg.index = index++;
        seg.start = start;
        seg.end = std::min(start + width, file_size);
        plan.push_back(seg);
    }

    return plan;
}

auto segment_file_name(std::string_view name, uint32_t index) -> std::string {
    std::string result(name);
    result += segment_suffix;
    result += std::to_string(index);
    return result;
}

auto staging_file_name(std::string_view name) -> std::string {
    std::string result(name);
    result += staging_suffix;
    return result;
}

auto is_in_flight_name(std::string_view name) -> bool {
    if (name.size() > staging_suffix.size() && name.ends_with(staging_suffix)) {
        return true;
    }

    auto pos = name.rfind(segment_suffix);
    if (pos == std::string_view::npos || pos == 0) {
        return false;
    }

    auto digits = name.substr(pos + segment_suffix.size());
    if (digits.empty()) {
        return false;
    }
    return std::all_of(digits.begin(), digits.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

}  // namespace kcenon::media_fetch
