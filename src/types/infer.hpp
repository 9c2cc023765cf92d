#pragma once
#include <string_view>
#include <string>

#include "cell.hpp"
#include "coerce.hpp"

namespace dprof {

// Semantic type reported for a column.
enum class data_type { integer_, float_, string_, datetime_, boolean_ };

inline const char* to_string(data_type t) {
    switch (t) {
        case data_type::integer_:  return "integer";
        case data_type::float_:    return "float";
        case data_type::datetime_: return "datetime";
        case data_type::boolean_:  return "boolean";
        default:                   return "string";
    }
}

// True when every non-null, non-blank value coerces and there is at least
// one of them. Blank text coerces to a missing value and does not count
// against the column.
template <class Coerce>
inline bool all_coerce(const column& col, Coerce&& coerce) {
    bool any = false;
    for (const auto& v : col.values) {
        if (is_null(v) || is_blank_text(v)) continue;
        if (!coerce(v)) return false;
        any = true;
    }
    return any;
}

inline bool has_non_null(const column& col) {
    for (const auto& v : col.values) if (!is_null(v)) return true;
    return false;
}

// Native storage wins; text is tried as numbers, then as timestamps, and
// falls back to string. Numeric text is always reported as float.
inline data_type infer_type(const column& col) {
    switch (col.storage) {
        case storage_type::int64_:    return data_type::integer_;
        case storage_type::float64_:  return data_type::float_;
        case storage_type::datetime_: return data_type::datetime_;
        case storage_type::boolean_:  return data_type::boolean_;
        case storage_type::text_:     break;
    }
    if (!has_non_null(col)) return data_type::string_;
    if (all_coerce(col, [](const cell& c) { return coerce_number(c).has_value(); }))
        return data_type::float_;
    if (all_coerce(col, [](const cell& c) { return coerce_datetime(c).has_value(); }))
        return data_type::datetime_;
    return data_type::string_;
}

}
