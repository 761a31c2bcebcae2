#include <jsontab/sanitize/sanitizer.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace jsontab::sanitize {

namespace {

// Bytes that break common CSV and spreadsheet readers. Tab (0x09) and LF
// (0x0A) are kept; CR is folded into LF before this check.
constexpr auto is_unsafe_control(unsigned char ch) noexcept -> bool {
    return ch <= 0x08 || (ch >= 0x0B && ch <= 0x1F) || ch == 0x7F;
}

auto serialize_structured(const Structured& value, SanitizeStats* stats) -> std::string {
    try {
        return json::dump_compact(value.value);
    } catch (const json::Value::type_error& e) {
        spdlog::debug("lenient serialization for structured cell: {}", e.what());
        if (stats != nullptr) {
            ++stats->degraded;
        }
        return json::dump_lenient(value.value);
    }
}

}  // namespace

auto clean_string(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto ch = static_cast<unsigned char>(text[i]);
        if (ch == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            continue;
        }
        if (is_unsafe_control(ch)) {
            continue;
        }
        out.push_back(text[i]);
    }
    return out;
}

void sanitize_cell(Cell& cell, SanitizeStats* stats) {
    if (auto* text = std::get_if<std::string>(&cell)) {
        auto cleaned = clean_string(*text);
        if (cleaned != *text) {
            *text = std::move(cleaned);
            if (stats != nullptr) {
                ++stats->strings_rewritten;
            }
        }
        return;
    }
    if (const auto* structured = std::get_if<Structured>(&cell)) {
        // The JSON writer escapes bytes below 0x20 but leaves DEL raw.
        auto serialized = clean_string(serialize_structured(*structured, stats));
        cell = std::move(serialized);
        if (stats != nullptr) {
            ++stats->structured_serialized;
        }
    }
}

auto sanitize(Table& table) -> SanitizeStats {
    SanitizeStats stats;
    table.for_each_cell([&stats](Cell& cell) { sanitize_cell(cell, &stats); });
    spdlog::debug("sanitized table: {} strings rewritten, {} structured cells serialized",
                  stats.strings_rewritten, stats.structured_serialized);
    if (stats.degraded > 0) {
        spdlog::debug("{} cells needed lenient serialization", stats.degraded);
    }
    return stats;
}

}  // namespace jsontab::sanitize
