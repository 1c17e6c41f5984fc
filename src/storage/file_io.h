/**
 * @file file_io.h
 * @brief Whole-file helpers shared by the HTTP-backed stores
 */

#ifndef KCENON_OBJECT_TRANSFER_SRC_STORAGE_FILE_IO_H
#define KCENON_OBJECT_TRANSFER_SRC_STORAGE_FILE_IO_H

#include "kcenon/object_transfer/core/types.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

namespace kcenon::object_transfer::detail {

inline auto write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data)
    -> result<uint64_t> {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return unexpected{error{error_code::staging_io_error,
                "Failed to create directory: " + ec.message()}};
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return unexpected{error{error_code::staging_io_error,
            "Failed to open file for writing: " + path.string()}};
    }
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!file) {
        return unexpected{error{error_code::staging_io_error,
            "Failed to write file: " + path.string()}};
    }
    return static_cast<uint64_t>(data.size());
}

inline auto read_file(const std::filesystem::path& path) -> result<std::vector<uint8_t>> {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected{error{error_code::staging_io_error,
            "Failed to get file size: " + path.string()}};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::staging_io_error,
            "Failed to open file for reading: " + path.string()}};
    }

    std::vector<uint8_t> data(size);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
    if (!file) {
        return unexpected{error{error_code::staging_io_error,
            "Failed to read file: " + path.string()}};
    }
    return data;
}

}  // namespace kcenon::object_transfer::detail

#endif  // KCENON_OBJECT_TRANSFER_SRC_STORAGE_FILE_IO_H
