#pragma once

#include <jsontab/core/table.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace jsontab::sanitize {

/// Counters from one sanitize() pass.
struct SanitizeStats {
    std::size_t strings_rewritten = 0;
    std::size_t structured_serialized = 0;
    /// Structured cells that needed the lenient serializer.
    std::size_t degraded = 0;
};

/// Normalize CR LF and lone CR to LF, then drop control bytes 0x00-0x08,
/// 0x0B-0x1F and 0x7F. LF survives.
[[nodiscard]] auto clean_string(std::string_view text) -> std::string;

/// Rewrite one cell for CSV output. Serialization failures degrade to a
/// lenient conversion instead of propagating.
void sanitize_cell(Cell& cell, SanitizeStats* stats = nullptr);

/// Rewrite every cell of `table` in place. Rows and columns are unchanged.
auto sanitize(Table& table) -> SanitizeStats;

}  // namespace jsontab::sanitize
