#include <jsontab/json/loader.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace jsontab::json {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\f\v";

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(kWhitespace);
    return text.substr(begin, end - begin + 1);
}

// nlohmann messages look like
//   "[json.exception.parse_error.101] parse error at line 1, column 4: syntax error ..."
// Location is reported separately, so keep only the complaint itself.
auto describe(const Value::parse_error& error) -> std::string {
    std::string_view text = error.what();
    if (auto close = text.find("] "); close != std::string_view::npos) {
        text.remove_prefix(close + 2);
    }
    if (text.starts_with("parse error at line")) {
        if (auto colon = text.find(": "); colon != std::string_view::npos) {
            text.remove_prefix(colon + 2);
        }
    }
    return std::string(text);
}

struct Position {
    std::size_t line = 1;
    std::size_t column = 1;
};

/// 1-based line/column of the byte at `offset` (nlohmann's `byte` counts
/// characters read, so the offending character sits at `byte - 1`).
auto locate(std::string_view text, std::size_t offset) -> Position {
    const std::size_t index = std::min(offset > 0 ? offset - 1 : 0, text.size());
    Position pos;
    for (std::size_t i = 0; i < index; ++i) {
        if (text[i] == '\n') {
            ++pos.line;
            pos.column = 1;
        } else {
            ++pos.column;
        }
    }
    return pos;
}

/// Split on LF, CR LF and lone CR, keeping empty lines so that numbering
/// matches what an editor shows.
auto split_lines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n' || text[i] == '\r') {
            lines.push_back(text.substr(start, i - start));
            if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            start = i + 1;
        }
    }
    if (start < text.size()) {
        lines.push_back(text.substr(start));
    }
    return lines;
}

}  // namespace

auto ParseError::format() const -> std::string {
    if (mode == ParseMode::Lines) {
        return fmt::format("JSON Lines error at line {}, column {}: {}", line, column, message);
    }
    return fmt::format("JSON error at line {}, column {} (byte {}): {}", line, column, offset,
                       message);
}

auto parse_document(std::string_view text) -> ParseResult {
    try {
        return Value::parse(text);
    } catch (const Value::parse_error& e) {
        auto pos = locate(text, e.byte);
        return std::unexpected(ParseError{
            .message = describe(e),
            .mode = ParseMode::Document,
            .line = pos.line,
            .column = pos.column,
            .offset = e.byte,
        });
    }
}

auto parse_lines(std::string_view text) -> ParseResult {
    Value records = Value::array();
    const auto lines = split_lines(text);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        auto line = trim(lines[i]);
        if (line.empty()) {
            continue;
        }
        try {
            records.push_back(Value::parse(line));
        } catch (const Value::parse_error& e) {
            return std::unexpected(ParseError{
                .message = describe(e),
                .mode = ParseMode::Lines,
                .line = i + 1,
                .column = static_cast<std::size_t>(line.data() - lines[i].data()) +
                          locate(line, e.byte).column,
            });
        }
    }
    return records;
}

auto load(std::string_view text) -> ParseResult {
    auto document = parse_document(text);
    if (document) {
        spdlog::debug("loaded input as a single JSON document");
        return document;
    }

    spdlog::debug("single-document parse failed ({}); trying JSON Lines",
                  document.error().format());
    auto lines = parse_lines(text);
    if (!lines) {
        return lines;
    }
    if (lines->empty()) {
        return document;
    }
    spdlog::debug("loaded {} JSON Lines records", lines->size());
    return lines;
}

}  // namespace jsontab::json
