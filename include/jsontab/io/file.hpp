#pragma once

#include <expected>
#include <filesystem>
#include <string>

namespace jsontab::io {

/// A file could not be opened, read or written.
struct IoError {
    std::string message;
    std::filesystem::path path;

    [[nodiscard]] auto format() const -> std::string;
};

/// Read a whole file into memory.
[[nodiscard]] auto read_text_file(const std::filesystem::path& path)
    -> std::expected<std::string, IoError>;

}  // namespace jsontab::io
