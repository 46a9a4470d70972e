#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <initializer_list>
#include <map>
#include <vector>
#include <memory>
#include <stdexcept>
#include <ostream>
#include <functional>
#include <type_traits>
#include <limits>
#include <optional>
#include <cmath>

namespace sc {

class Value;

// Native callable carried by a Function value.
using Callable = std::function<Value(const std::vector<Value>&)>;

struct FileInfo {
    std::string name;
    int64_t size = 0;
    std::string mime;
};

// Dynamic, untyped value handed to schemas for parsing. Copies are deep,
// except for Pointer (shared pointee), Function and File (immutable payloads).
class Value {
  public:
    enum TYPE {
        Null,
        Boolean,
        Integer,
        Double,
        BigInt,
        String,
        Array,
        Object,
        Set,
        Map,
        Pointer,
        Function,
        File
    };

  private:
    TYPE my_type = Null;
    bool m_bool = false;
    int64_t m_int = 0;
    double m_double = 0.0;
    // String payload, or canonical decimal digits for BigInt
    std::string m_string;
    // Array and Set elements
    std::vector<Value> m_array;
    std::map<std::string, Value> m_object_map;
    // Map entries in insertion order
    std::vector<std::pair<Value, Value> > m_entries;
    std::shared_ptr<Value> m_pointer;
    std::shared_ptr<const Callable> m_function;
    std::shared_ptr<const FileInfo> m_file;

  public:
    Value() = default;
    Value(const Value&) = default;
    Value(Value&&) noexcept = default;
    Value& operator=(const Value&) = default;
    Value& operator=(Value&&) noexcept = default;
    ~Value() = default;

    Value(std::nullptr_t) {}

    Value(bool b) : my_type(Boolean), m_bool(b) {}

    template <typename T,
              typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value,
                                      int>::type = 0>
    Value(T n) : my_type(Integer), m_int(static_cast<int64_t>(n)) {
        // unsigned values past INT64_MAX would wrap negative
        if (std::is_unsigned<T>::value && static_cast<uint64_t>(n) > static_cast<uint64_t>(INT64_MAX))
            throw std::invalid_argument("integer " + std::to_string(static_cast<uint64_t>(n)) +
                                        " does not fit in int64; use Value::bigint");
    }

    Value(double x) : my_type(Double), m_double(x) {}
    Value(float x) : my_type(Double), m_double(static_cast<double>(x)) {}

    Value(const std::string& s) : my_type(String), m_string(s) {}
    Value(std::string&& s) : my_type(String), m_string(std::move(s)) {}
    Value(const char* s) : my_type(String), m_string(s) {}

    Value(const std::vector<Value>& v) : my_type(Array), m_array(v) {}
    Value(std::vector<Value>&& v) : my_type(Array), m_array(std::move(v)) {}

    // Construct an object from an initializer list of (key, value) pairs
    Value(std::initializer_list<std::pair<const std::string, Value> > init)
        : my_type(Object), m_object_map(init) {}

    static Value null() { return Value(); }
    static Value array(std::vector<Value> elements = {});
    static Value object(std::map<std::string, Value> fields = {});
    // Duplicate elements (by deep equality) are dropped, first one wins.
    static Value set(const std::vector<Value>& elements = {});
    static Value map(std::vector<std::pair<Value, Value> > entries = {});
    // Accepts an optional sign followed by decimal digits; throws
    // std::invalid_argument otherwise. Leading zeros are removed.
    static Value bigint(const std::string& digits);
    static Value pointer(Value pointee);
    static Value null_pointer();
    static Value function(Callable fn);
    static Value file(std::string name, int64_t size, std::string mime = "");

    TYPE type() const noexcept { return my_type; }
    std::string typeString() const;

    bool isNull() const noexcept { return my_type == Null; }
    bool isBool() const noexcept { return my_type == Boolean; }
    bool isInt() const noexcept { return my_type == Integer; }
    bool isDouble() const noexcept { return my_type == Double; }
    bool isNumber() const noexcept { return my_type == Integer || my_type == Double; }
    bool isBigInt() const noexcept { return my_type == BigInt; }
    bool isString() const noexcept { return my_type == String; }
    bool isArray() const noexcept { return my_type == Array; }
    bool isObject() const noexcept { return my_type == Object; }
    bool isSet() const noexcept { return my_type == Set; }
    bool isMap() const noexcept { return my_type == Map; }
    bool isPointer() const noexcept { return my_type == Pointer; }
    bool isNullPointer() const noexcept { return my_type == Pointer && !m_pointer; }
    bool isFunction() const noexcept { return my_type == Function; }
    bool isFile() const noexcept { return my_type == File; }
    // Scalars are everything that is not a container, pointer or callable.
    bool isScalar() const noexcept { return my_type <= String; }

    bool asBool() const {
        if (my_type != Boolean) throw std::logic_error("Value is not a boolean: " + typeString());
        return m_bool;
    }

    int64_t asInt() const {
        if (my_type == Integer) return m_int;
        if (my_type == Double) return static_cast<int64_t>(m_double);
        throw std::logic_error("Value is not an integer: " + typeString());
    }

    double asDouble() const {
        if (my_type == Double) return m_double;
        if (my_type == Integer) return static_cast<double>(m_int);
        if (my_type == BigInt) return std::stod(m_string);
        throw std::logic_error("Value is not a number: " + typeString());
    }

    const std::string& asString() const {
        if (my_type == String || my_type == BigInt) return m_string;
        throw std::logic_error("Value is not a string: " + typeString());
    }

    // Decimal digits of an Integer or BigInt value.
    std::string asBigInt() const {
        if (my_type == BigInt) return m_string;
        if (my_type == Integer) return std::to_string(m_int);
        throw std::logic_error("Value is not a bigint: " + typeString());
    }

    const std::vector<Value>& asArray() const {
        if (my_type == Array || my_type == Set) return m_array;
        throw std::logic_error("Value is not a list: " + typeString());
    }

    const std::map<std::string, Value>& asObject() const {
        if (my_type == Object) return m_object_map;
        throw std::logic_error("Value is not an object: " + typeString());
    }

    const std::vector<std::pair<Value, Value> >& asEntries() const {
        if (my_type == Map) return m_entries;
        throw std::logic_error("Value is not a map: " + typeString());
    }

    const std::shared_ptr<Value>& pointee() const {
        if (my_type != Pointer) throw std::logic_error("Value is not a pointer: " + typeString());
        return m_pointer;
    }

    const FileInfo& asFile() const {
        if (my_type != File) throw std::logic_error("Value is not a file: " + typeString());
        return *m_file;
    }

    const std::shared_ptr<const Callable>& asFunction() const {
        if (my_type != Function) throw std::logic_error("Value is not a function: " + typeString());
        return m_function;
    }

    Value call(const std::vector<Value>& args) const {
        if (my_type != Function) throw std::logic_error("Value is not callable: " + typeString());
        return (*m_function)(args);
    }

    int count(const std::string& key) const {
        if (my_type != Object) return 0;
        return static_cast<int>(m_object_map.count(key));
    }

    bool has(const std::string& key) const noexcept { return my_type == Object && m_object_map.count(key) == 1; }
    bool contains(const std::string& k) const noexcept { return has(k); }

    // Element count for containers, zero for everything else
    size_t size() const noexcept {
        switch (my_type) {
            case Array:
            case Set:
                return m_array.size();
            case Object:
                return m_object_map.size();
            case Map:
                return m_entries.size();
            default:
                return 0;
        }
    }

    bool empty() const noexcept { return size() == 0; }

    Value& operator[](const std::string& k) {
        if (my_type != Object) {
            my_type = Object;
            m_object_map.clear();
        }
        return m_object_map[k];
    }

    const Value& operator[](const std::string& k) const { return at(k); }

    Value& operator[](size_t index) {
        if (my_type == Null) my_type = Array;
        if (my_type != Array) throw std::logic_error("Not a list");
        if (index >= m_array.size()) m_array.resize(index + 1);
        return m_array[index];
    }

    const Value& operator[](size_t index) const { return at(index); }

    const Value& at(size_t index) const {
        if (my_type != Array && my_type != Set) throw std::logic_error("Not a list");
        return m_array.at(index);
    }

    const Value& at(const std::string& k) const;
    Value& at(const std::string& k);

    // Map lookup by deep key equality; nullptr when absent.
    const Value* find(const Value& key) const;

    std::vector<std::string> keys() const {
        if (my_type != Object) return {};
        std::vector<std::string> out;
        out.reserve(m_object_map.size());
        for (auto const& p : m_object_map) out.push_back(p.first);
        return out;
    }

    std::vector<std::pair<std::string, Value> > items() const {
        if (my_type != Object) throw std::logic_error("Cannot get items of non-object type");
        return std::vector<std::pair<std::string, Value> >(m_object_map.begin(), m_object_map.end());
    }

    void push_back(Value v) {
        if (my_type == Null) my_type = Array;
        if (my_type == Set) {
            insert(std::move(v));
            return;
        }
        if (my_type != Array) throw std::logic_error("Cannot append to " + typeString());
        m_array.push_back(std::move(v));
    }

    // Set insertion; returns false when an equal element is already present.
    bool insert(Value v);
    // Map insertion; replaces the value of an equal key.
    void insert(Value key, Value v);

    Value& erase(const std::string& k) {
        if (my_type == Object) m_object_map.erase(k);
        return *this;
    }

    // Deep equality: numbers compare numerically across Integer, Double and
    // BigInt, NaN equals NaN, +0 equals -0. Functions compare by identity.
    bool operator==(const Value& rhs) const;
    bool operator!=(const Value& rhs) const { return not(*this == rhs); }

    std::string dump(int indent = 0) const;
    std::string to_string() const { return dump(); }
};

std::ostream& operator<<(std::ostream& os, const Value& v);

// Three-way comparison of two decimal digit strings with optional sign.
int compare_bigint(const std::string& a, const std::string& b);

// Number of Unicode code points in a UTF-8 string.
size_t utf8_length(const std::string& s);

// Typed view of a value used by typed refinements: std::nullopt when the
// value does not hold a T or does not fit in it.
template <typename T>
std::optional<T> value_as(const Value& v) {
    if constexpr (std::is_same<T, Value>::value) {
        return v;
    } else if constexpr (std::is_same<T, bool>::value) {
        if (!v.isBool()) return std::nullopt;
        return v.asBool();
    } else if constexpr (std::is_integral<T>::value) {
        int64_t n = 0;
        if (v.isInt()) {
            n = v.asInt();
        } else if (v.isDouble()) {
            double d = v.asDouble();
            if (!std::isfinite(d) || std::trunc(d) != d || std::fabs(d) > 9.2e18) return std::nullopt;
            n = static_cast<int64_t>(d);
        } else {
            return std::nullopt;
        }
        if (std::is_signed<T>::value) {
            if (n < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
                n > static_cast<int64_t>(std::numeric_limits<T>::max()))
                return std::nullopt;
        } else {
            if (n < 0 || static_cast<uint64_t>(n) > static_cast<uint64_t>(std::numeric_limits<T>::max()))
                return std::nullopt;
        }
        return static_cast<T>(n);
    } else if constexpr (std::is_floating_point<T>::value) {
        if (!v.isNumber()) return std::nullopt;
        return static_cast<T>(v.asDouble());
    } else if constexpr (std::is_same<T, std::string>::value) {
        if (!v.isString()) return std::nullopt;
        return v.asString();
    } else if constexpr (std::is_same<T, std::vector<Value> >::value) {
        if (!v.isArray()) return std::nullopt;
        return v.asArray();
    } else if constexpr (std::is_same<T, std::map<std::string, Value> >::value) {
        if (!v.isObject()) return std::nullopt;
        return v.asObject();
    } else {
        static_assert(sizeof(T) == 0, "value_as: unsupported target type");
    }
}

}  // namespace sc
