#ifndef STENCIL_LOG_JSON_DETAIL_HPP
#define STENCIL_LOG_JSON_DETAIL_HPP

#include "../core/field_value.hpp"
#include "../core/encoding_error.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <cmath>

namespace stencil {
namespace detail {
namespace json {

    /// Insertion-ordered so that object members come out in the order they
    /// are added (FieldMap iteration is already sorted).
    typedef nlohmann::ordered_json Json;

    /// Convert a field value to its JSON-native form.
    ///
    /// Strict mode rejects NaN and infinities with EncodingError, since JSON
    /// has no spelling for them.  Lenient mode writes them as null and is used
    /// to build the best-effort line after a strict failure.
    inline Json toJson(const FieldValue &value, bool strict) {
        switch (value.kind()) {
            case FieldValue::Kind::Null:
                return Json(nullptr);
            case FieldValue::Kind::Bool:
                return Json(value.asBool());
            case FieldValue::Kind::Integer:
                return Json(value.asInteger());
            case FieldValue::Kind::Unsigned:
                return Json(value.asUnsigned());
            case FieldValue::Kind::Float: {
                double d = value.asFloat();
                if (!std::isfinite(d)) {
                    if (strict) {
                        throw EncodingError("json: unsupported value: " + value.toString());
                    }
                    return Json(nullptr);
                }
                return Json(d);
            }
            case FieldValue::Kind::String:
                return Json(value.asString());
            case FieldValue::Kind::Map: {
                Json obj = Json::object();
                for (const auto &kv : value.asMap()) {
                    obj[kv.first] = toJson(kv.second, strict);
                }
                return obj;
            }
        }
        return Json(nullptr);
    }

    inline Json toJson(const FieldMap &fields, bool strict) {
        Json obj = Json::object();
        for (const auto &kv : fields) {
            obj[kv.first] = toJson(kv.second, strict);
        }
        return obj;
    }

    /// Compact serialization.  In strict mode invalid UTF-8 anywhere in the
    /// document raises EncodingError; otherwise it is replaced with U+FFFD.
    inline std::string dump(const Json &j, bool strict) {
        if (!strict) {
            return j.dump(-1, ' ', false, Json::error_handler_t::replace);
        }
        try {
            return j.dump();
        } catch (const Json::type_error &e) {
            throw EncodingError(std::string("json: ") + e.what());
        }
    }

    /// Strict compact encoding of a single value.
    inline std::string encode(const FieldValue &value) {
        return dump(toJson(value, true), true);
    }

} // namespace json
} // namespace detail
} // namespace stencil

#endif // STENCIL_LOG_JSON_DETAIL_HPP
