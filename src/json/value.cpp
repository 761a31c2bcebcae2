#include <jsontab/json/value.hpp>

namespace jsontab::json {

auto dump_compact(const Value& value) -> std::string {
    return value.dump(-1, ' ', false, Value::error_handler_t::strict);
}

auto dump_lenient(const Value& value) -> std::string {
    return value.dump(-1, ' ', false, Value::error_handler_t::replace);
}

}  // namespace jsontab::json
