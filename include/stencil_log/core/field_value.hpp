#ifndef STENCIL_LOG_FIELD_VALUE_HPP
#define STENCIL_LOG_FIELD_VALUE_HPP

#include <string>
#include <map>
#include <memory>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <climits>
#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <utility>

// strtod_l / _strtod_l parse with the "C" locale regardless of the
// process-wide locale set via setlocale().
#if defined(_MSC_VER)
    #include <locale.h>
#elif defined(__APPLE__)
    #include <xlocale.h>
#elif defined(__GLIBC__) || defined(__FreeBSD__)
    #include <locale.h>
#endif

namespace stencil {

    class FieldValue;

    /// Field data of one record.  Sorted by key, which makes every rendering
    /// path iterate in the same order.
    typedef std::map<std::string, FieldValue> FieldMap;

    /// Value of a single record field.
    ///
    /// A closed set of kinds so that renderers can switch over kind()
    /// instead of guessing the type from a string:
    ///   Null, Bool, Integer (64-bit signed), Unsigned, Float, String,
    ///   Map (nested FieldMap)
    ///
    /// Unsigned only holds values above LLONG_MAX; smaller unsigned inputs
    /// are stored as Integer so that FieldValue(5u) == FieldValue(5).
    ///
    /// Nested maps are held by shared pointer and never mutated after
    /// construction, so copying a FieldValue is cheap.
    class FieldValue {
    public:
        enum class Kind { Null, Bool, Integer, Unsigned, Float, String, Map };

        FieldValue() : m_kind(Kind::Null), m_bool(false), m_int(0), m_uint(0), m_float(0.0) {}

        FieldValue(std::nullptr_t) : FieldValue() {}

        FieldValue(bool v) : m_kind(Kind::Bool), m_bool(v), m_int(0), m_uint(0), m_float(0.0) {}

        template<typename T,
                 typename std::enable_if<std::is_integral<T>::value && std::is_signed<T>::value &&
                                         !std::is_same<T, bool>::value, int>::type = 0>
        FieldValue(T v)
            : m_kind(Kind::Integer), m_bool(false), m_int(static_cast<long long>(v)), m_uint(0)
            , m_float(0.0) {}

        template<typename T,
                 typename std::enable_if<std::is_integral<T>::value && std::is_unsigned<T>::value &&
                                         !std::is_same<T, bool>::value, long>::type = 0>
        FieldValue(T v)
            : m_kind(fitsInteger(v) ? Kind::Integer : Kind::Unsigned), m_bool(false)
            , m_int(fitsInteger(v) ? static_cast<long long>(v) : 0)
            , m_uint(fitsInteger(v) ? 0 : static_cast<unsigned long long>(v)), m_float(0.0) {}

        FieldValue(double v) : m_kind(Kind::Float), m_bool(false), m_int(0), m_uint(0), m_float(v) {}

        FieldValue(float v)
            : m_kind(Kind::Float), m_bool(false), m_int(0), m_uint(0)
            , m_float(static_cast<double>(v)) {}

        FieldValue(const char *v)
            : m_kind(v ? Kind::String : Kind::Null), m_bool(false), m_int(0), m_uint(0), m_float(0.0)
            , m_string(v ? v : "") {}

        FieldValue(std::string v)
            : m_kind(Kind::String), m_bool(false), m_int(0), m_uint(0), m_float(0.0)
            , m_string(std::move(v)) {}

        FieldValue(const FieldMap &map);

        Kind kind() const { return m_kind; }

        bool isNull() const { return m_kind == Kind::Null; }
        bool isMap() const { return m_kind == Kind::Map; }

        bool asBool() const {
            expect(Kind::Bool, "bool");
            return m_bool;
        }

        long long asInteger() const {
            expect(Kind::Integer, "integer");
            return m_int;
        }

        unsigned long long asUnsigned() const {
            expect(Kind::Unsigned, "unsigned integer");
            return m_uint;
        }

        double asFloat() const {
            expect(Kind::Float, "float");
            return m_float;
        }

        const std::string &asString() const {
            expect(Kind::String, "string");
            return m_string;
        }

        const FieldMap &asMap() const;

        /// Default textual representation, as inlined into templates and
        /// appended after the message in text output.
        std::string toString() const;

        bool operator==(const FieldValue &other) const;

        bool operator!=(const FieldValue &other) const { return !(*this == other); }

    private:
        template<typename T>
        static bool fitsInteger(T v) {
            return static_cast<unsigned long long>(v) <= static_cast<unsigned long long>(LLONG_MAX);
        }

        void expect(Kind kind, const char *name) const {
            if (m_kind != kind) {
                throw std::logic_error(std::string("FieldValue does not hold a ") + name);
            }
        }

        Kind m_kind;
        bool m_bool;
        long long m_int;
        unsigned long long m_uint;
        double m_float;
        std::string m_string;
        std::shared_ptr<const FieldMap> m_map;
    };

namespace detail {

    /// Locale-independent strtod.  Falls back to plain strtod on platforms
    /// without strtod_l.
    inline double strtodLocaleIndependent(const char *str, char **endptr) {
#if defined(_MSC_VER)
        static _locale_t c_locale = _create_locale(_LC_ALL, "C");
        return _strtod_l(str, endptr, c_locale);
#elif defined(__GLIBC__) || defined(__APPLE__) || defined(__FreeBSD__)
        static locale_t c_locale = newlocale(LC_ALL_MASK, "C", (locale_t)0);
        return strtod_l(str, endptr, c_locale);
#else
        return std::strtod(str, endptr);
#endif
    }

    inline std::string printfDouble(const char *fmt, int precision, double value) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), fmt, precision, value);
        // some locales use ',' as decimal separator
        for (char *p = buf; *p; ++p) {
            if (*p == ',') *p = '.';
        }
        return std::string(buf);
    }

    /// Shortest representation that parses back to the same double.
    /// Exponent form is used when the decimal exponent is below -4 or at
    /// least 6: 100 -> "100", 1e6 -> "1e+06", 3.14 -> "3.14".
    inline std::string formatFloat(double value) {
        if (std::isnan(value)) return "NaN";
        if (std::isinf(value)) return value > 0 ? "+Inf" : "-Inf";
        if (value == 0.0) return std::signbit(value) ? "-0" : "0";

        int digits = 1;
        std::string sci;
        for (; digits <= 17; ++digits) {
            sci = printfDouble("%.*e", digits - 1, value);
            if (strtodLocaleIndependent(sci.c_str(), nullptr) == value) break;
        }
        if (digits > 17) digits = 17;

        int exponent = std::atoi(sci.c_str() + sci.find('e') + 1);
        if (exponent < -4 || exponent >= 6) {
            return sci;
        }
        int decimals = digits - 1 - exponent;
        return printfDouble("%.*f", decimals < 0 ? 0 : decimals, value);
    }

} // namespace detail

    inline FieldValue::FieldValue(const FieldMap &map)
        : m_kind(Kind::Map), m_bool(false), m_int(0), m_uint(0), m_float(0.0)
        , m_map(std::make_shared<FieldMap>(map)) {}

    inline const FieldMap &FieldValue::asMap() const {
        expect(Kind::Map, "map");
        return *m_map;
    }

    inline std::string FieldValue::toString() const {
        switch (m_kind) {
            case Kind::Null: return "<nil>";
            case Kind::Bool: return m_bool ? "true" : "false";
            case Kind::Integer: return std::to_string(m_int);
            case Kind::Unsigned: return std::to_string(m_uint);
            case Kind::Float: return detail::formatFloat(m_float);
            case Kind::String: return m_string;
            case Kind::Map: {
                std::string out = "map[";
                bool first = true;
                for (const auto &kv : *m_map) {
                    if (!first) out += ' ';
                    out += kv.first;
                    out += ':';
                    out += kv.second.toString();
                    first = false;
                }
                out += ']';
                return out;
            }
        }
        return std::string();
    }

    inline bool FieldValue::operator==(const FieldValue &other) const {
        if (m_kind != other.m_kind) return false;
        switch (m_kind) {
            case Kind::Null: return true;
            case Kind::Bool: return m_bool == other.m_bool;
            case Kind::Integer: return m_int == other.m_int;
            case Kind::Unsigned: return m_uint == other.m_uint;
            case Kind::Float: return m_float == other.m_float;
            case Kind::String: return m_string == other.m_string;
            case Kind::Map: return *m_map == *other.m_map;
        }
        return false;
    }

} // namespace stencil

#endif // STENCIL_LOG_FIELD_VALUE_HPP
