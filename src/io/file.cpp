#include <jsontab/io/file.hpp>

#include <fmt/core.h>

#include <fstream>
#include <iterator>

namespace jsontab::io {

auto IoError::format() const -> std::string {
    return fmt::format("{}: {}", path.string(), message);
}

auto read_text_file(const std::filesystem::path& path) -> std::expected<std::string, IoError> {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return std::unexpected(IoError{.message = "cannot open for reading", .path = path});
    }
    std::string text(std::istreambuf_iterator<char>{input}, {});
    if (input.bad()) {
        return std::unexpected(IoError{.message = "read failed", .path = path});
    }
    return text;
}

}  // namespace jsontab::io
