#include "dispatcher/tool_response.hpp"

#include <cmath>
#include <type_traits>

namespace sqlmcp {

Json ToolResponse::to_json() const {
    Json items = Json::array();
    for (const auto& text : content) {
        Json item = Json::object();
        item["type"] = "text";
        item["text"] = text;
        items.push_back(std::move(item));
    }

    Json envelope = Json::object();
    envelope["content"] = std::move(items);
    if (is_error) {
        envelope["isError"] = true;
    }
    return envelope;
}

Json cell_to_json(const CellValue& value) {
    return std::visit([](const auto& v) -> Json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, Blob>) {
            Json buffer = Json::object();
            buffer["type"] = "Buffer";
            buffer["data"] = Json::array();
            for (const uint8_t byte : v) {
                buffer["data"].push_back(byte);
            }
            return buffer;
        } else if constexpr (std::is_same_v<T, double>) {
            // Integral reals print without a fraction, as JavaScript numbers do
            constexpr double kMaxSafeInteger = 9007199254740991.0;
            if (std::isfinite(v) && std::trunc(v) == v && std::fabs(v) <= kMaxSafeInteger) {
                return static_cast<int64_t>(v);
            }
            return v;
        } else {
            return Json(v);
        }
    }, value);
}

Json rows_to_json(const QueryResult& result) {
    Json rows = Json::array();
    for (const auto& row : result.rows) {
        Json obj = Json::object();
        for (size_t i = 0; i < row.size() && i < result.column_names.size(); ++i) {
            // Duplicate column names collapse onto the last value
            obj[result.column_names[i]] = cell_to_json(row[i]);
        }
        rows.push_back(std::move(obj));
    }
    return rows;
}

std::string format_rows(const QueryResult& result) {
    return dump_json(rows_to_json(result), 2);
}

std::string format_affected_rows(const QueryResult& result) {
    Json entry = Json::object();
    entry["affectedRows"] = result.affected_rows;
    Json arr = Json::array();
    arr.push_back(std::move(entry));
    return dump_json(arr, 2);
}

} // namespace sqlmcp
