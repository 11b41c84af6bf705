//
// Created by igor on 19/10/2026.
//

#include "file_io.hh"
#include <failsafe/failsafe.hh>
#include <fstream>

namespace hershey_font::internal {

    std::vector<uint8_t> read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        THROW_IF(!file, std::runtime_error, "Cannot open file:", path.string());

        auto size = file.tellg();
        file.seekg(0, std::ios::beg);

        std::vector<uint8_t> data(static_cast<size_t>(size));
        THROW_IF(!file.read(reinterpret_cast<char*>(data.data()), size),
                 std::runtime_error, "Failed to read file:", path.string());

        return data;
    }

    std::vector<std::string_view> split_lines(std::string_view text) {
        std::vector<std::string_view> lines;
        while (!text.empty()) {
            const auto nl = text.find('\n');
            lines.push_back(text.substr(0, nl));
            if (nl == std::string_view::npos) {
                break;
            }
            text.remove_prefix(nl + 1);
        }
        return lines;
    }

}  // namespace hershey_font::internal
