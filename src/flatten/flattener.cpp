#include <jsontab/flatten/flattener.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace jsontab::flatten {

namespace {

class RecordBuilder {
   public:
    explicit RecordBuilder(const FlattenOptions& options) : options_(options) {}

    void add_object(const json::Value& object, const std::string& prefix, std::size_t level) {
        for (const auto& item : object.items()) {
            add_field(join(prefix, item.key()), item.value(), level);
        }
    }

    void add_field(std::string path, const json::Value& value, std::size_t level) {
        switch (value.type()) {
            case json::Kind::object:
                if (options_.max_level && level >= *options_.max_level) {
                    record_.emplace_back(std::move(path), Structured{value});
                    return;
                }
                add_object(value, path, level + 1);
                return;
            case json::Kind::array:
                add_array(std::move(path), value, level);
                return;
            case json::Kind::null:
            case json::Kind::boolean:
            case json::Kind::string:
            case json::Kind::number_integer:
            case json::Kind::number_unsigned:
            case json::Kind::number_float:
            case json::Kind::binary:
            case json::Kind::discarded:
                record_.emplace_back(std::move(path), cell_from_json(value));
                return;
        }
    }

    [[nodiscard]] auto take() -> Record { return std::move(record_); }

   private:
    void add_array(std::string path, const json::Value& array, std::size_t level) {
        switch (options_.arrays) {
            case ArrayPolicy::Serialize:
                record_.emplace_back(std::move(path), json::dump_lenient(array));
                return;
            case ArrayPolicy::Keep:
                record_.emplace_back(std::move(path), Structured{array});
                return;
            case ArrayPolicy::Index:
                for (std::size_t i = 0; i < array.size(); ++i) {
                    add_field(join(path, std::to_string(i)), array[i], level + 1);
                }
                return;
        }
    }

    // A top-level key is used as-is, even when empty.
    [[nodiscard]] auto join(const std::string& prefix, const std::string& key) const
        -> std::string {
        if (prefix.empty()) {
            return key;
        }
        std::string out;
        out.reserve(prefix.size() + options_.separator.size() + key.size());
        out.append(prefix).append(options_.separator).append(key);
        return out;
    }

    const FlattenOptions& options_;
    Record record_;
};

auto flatten_rows(const json::Value& array, const FlattenOptions& options) -> Table {
    Table table;
    for (const auto& element : array) {
        table.append_row(flatten_record(element, options));
    }
    return table;
}

}  // namespace

auto FlattenError::format() const -> std::string {
    return fmt::format("{} (depth {})", message, depth);
}

auto flatten_record(const json::Value& value, const FlattenOptions& options) -> Record {
    RecordBuilder builder(options);
    if (value.is_object()) {
        builder.add_object(value, std::string{}, 0);
    } else {
        builder.add_field(std::string(kValueColumn), value, 0);
    }
    return builder.take();
}

auto find_record_array(const json::Value& root) -> std::optional<std::string> {
    if (!root.is_object()) {
        return std::nullopt;
    }
    std::optional<std::string> found;
    for (const auto& item : root.items()) {
        if (!item.value().is_array()) {
            continue;
        }
        if (found) {
            return std::nullopt;
        }
        found = item.key();
    }
    return found;
}

auto meta_fields(const json::Value& root, std::string_view records_key,
                 const FlattenOptions& options) -> Record {
    Record meta;
    auto add = [&](const std::string& key, const json::Value& value) {
        auto name = options.meta_prefix + options.separator + key;
        if (value.is_structured()) {
            meta.emplace_back(std::move(name), json::dump_lenient(value));
        } else {
            meta.emplace_back(std::move(name), cell_from_json(value));
        }
    };

    for (const auto& item : root.items()) {
        if (item.key() == records_key) {
            continue;
        }
        // An object stored under the meta prefix itself ({"meta": {...}, "rows": [...]})
        // is the meta namespace: its members become meta columns directly.
        if (item.key() == options.meta_prefix && item.value().is_object()) {
            for (const auto& member : item.value().items()) {
                add(member.key(), member.value());
            }
            continue;
        }
        add(item.key(), item.value());
    }
    return meta;
}

void broadcast_meta(Table& table, const Record& meta) {
    for (const auto& [name, cell] : meta) {
        table.broadcast(name, cell);
    }
}

auto nesting_depth(const json::Value& value) -> std::size_t {
    std::size_t deepest = 0;
    std::vector<std::pair<const json::Value*, std::size_t>> pending{{&value, 0}};
    while (!pending.empty()) {
        auto [node, depth] = pending.back();
        pending.pop_back();
        if (!node->is_structured()) {
            continue;
        }
        deepest = std::max(deepest, depth + 1);
        for (const auto& child : *node) {
            pending.emplace_back(&child, depth + 1);
        }
    }
    return deepest;
}

auto flatten(const json::Value& root, const FlattenOptions& options) -> FlattenResult {
    if (auto depth = nesting_depth(root); depth > options.max_depth) {
        return std::unexpected(FlattenError{
            .message = fmt::format("input nests deeper than the limit of {}", options.max_depth),
            .depth = depth,
        });
    }

    switch (root.type()) {
        case json::Kind::array:
            spdlog::debug("flattening array root with {} records", root.size());
            return flatten_rows(root, options);
        case json::Kind::object:
            if (auto key = find_record_array(root)) {
                spdlog::debug("flattening records under '{}' with {} meta columns", *key,
                              root.size() - 1);
                auto table = flatten_rows(root.at(*key), options);
                broadcast_meta(table, meta_fields(root, *key, options));
                return table;
            }
            spdlog::debug("flattening object root as a single record");
            break;
        case json::Kind::null:
        case json::Kind::boolean:
        case json::Kind::string:
        case json::Kind::number_integer:
        case json::Kind::number_unsigned:
        case json::Kind::number_float:
        case json::Kind::binary:
        case json::Kind::discarded:
            break;
    }

    Table table;
    table.append_row(flatten_record(root, options));
    return table;
}

auto parse_array_policy(std::string_view text) -> std::optional<ArrayPolicy> {
    if (text == "serialize") {
        return ArrayPolicy::Serialize;
    }
    if (text == "index") {
        return ArrayPolicy::Index;
    }
    if (text == "keep") {
        return ArrayPolicy::Keep;
    }
    return std::nullopt;
}

}  // namespace jsontab::flatten
