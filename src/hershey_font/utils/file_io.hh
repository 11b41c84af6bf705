//
// Created by igor on 19/10/2026.
//
// Internal file helpers
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

namespace hershey_font::internal {

    /// Read a whole file, throws std::runtime_error on failure
    std::vector<uint8_t> read_file(const std::filesystem::path& path);

    /// Split text on '\n', the separators are not part of the lines
    std::vector<std::string_view> split_lines(std::string_view text);

}  // namespace hershey_font::internal
