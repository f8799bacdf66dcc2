//
// Created by gregorian-rayne on 2/3/26.
//

#ifndef FDEPS_FILE_UTILS_HPP
#define FDEPS_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File reading helpers.
 *
 * All operations return Result<T, Error>; none throw.
 */

#include "fdeps/result.hpp"
#include "fdeps/error.hpp"

#include <string>
#include <string_view>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fdeps::file_utils {

    namespace fs = std::filesystem;

    /**
     * Reads an entire file into a string.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    /**
     * Reads at most max_bytes from the start of a file.
     *
     * A result shorter than max_bytes means the whole file was read.
     */
    inline Result<std::string, Error> read_prefix(const fs::path& path, const std::size_t max_bytes) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::string buffer(max_bytes, '\0');
        file.read(buffer.data(), static_cast<std::streamsize>(max_bytes));

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        buffer.resize(static_cast<std::size_t>(file.gcount()));
        return Result<std::string, Error>::success(std::move(buffer));
    }

    /**
     * Writes a string to a file, creating parent directories as needed.
     */
    inline Result<void, Error> write_file(const fs::path& path, std::string_view content) {
        auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path, std::ios::binary);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

}  // namespace fdeps::file_utils

#endif //FDEPS_FILE_UTILS_HPP
