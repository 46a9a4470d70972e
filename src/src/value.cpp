#include <sc/value.h>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace sc {

Value Value::array(std::vector<Value> elements) {
    Value v;
    v.my_type = Array;
    v.m_array = std::move(elements);
    return v;
}

Value Value::object(std::map<std::string, Value> fields) {
    Value v;
    v.my_type = Object;
    v.m_object_map = std::move(fields);
    return v;
}

Value Value::set(const std::vector<Value>& elements) {
    Value v;
    v.my_type = Set;
    for (auto const& e : elements) v.insert(e);
    return v;
}

Value Value::map(std::vector<std::pair<Value, Value> > entries) {
    Value v;
    v.my_type = Map;
    for (auto& e : entries) v.insert(std::move(e.first), std::move(e.second));
    return v;
}

Value Value::bigint(const std::string& digits) {
    size_t i = 0;
    bool negative = false;
    if (i < digits.size() && (digits[i] == '-' || digits[i] == '+')) {
        negative = digits[i] == '-';
        ++i;
    }
    if (i == digits.size()) throw std::invalid_argument("empty bigint literal '" + digits + "'");
    for (size_t k = i; k < digits.size(); ++k) {
        if (digits[k] < '0' || digits[k] > '9')
            throw std::invalid_argument("invalid bigint literal '" + digits + "'");
    }
    while (i + 1 < digits.size() && digits[i] == '0') ++i;
    std::string body = digits.substr(i);
    Value v;
    v.my_type = BigInt;
    v.m_string = (negative && body != "0") ? "-" + body : body;
    return v;
}

Value Value::pointer(Value pointee) {
    Value v;
    v.my_type = Pointer;
    v.m_pointer = std::make_shared<Value>(std::move(pointee));
    return v;
}

Value Value::null_pointer() {
    Value v;
    v.my_type = Pointer;
    return v;
}

Value Value::function(Callable fn) {
    if (!fn) throw std::invalid_argument("cannot wrap an empty callable");
    Value v;
    v.my_type = Function;
    v.m_function = std::make_shared<const Callable>(std::move(fn));
    return v;
}

Value Value::file(std::string name, int64_t size, std::string mime) {
    Value v;
    v.my_type = File;
    v.m_file = std::make_shared<const FileInfo>(FileInfo{std::move(name), size, std::move(mime)});
    return v;
}

std::string Value::typeString() const {
    switch (my_type) {
        case Null:
            return "null";
        case Boolean:
            return "bool";
        case Integer:
        case Double:
            if (my_type == Double && std::isnan(m_double)) return "NaN";
            return "number";
        case BigInt:
            return "bigint";
        case String:
            return "string";
        case Array:
            return "array";
        case Object:
            return "object";
        case Set:
            return "set";
        case Map:
            return "map";
        case Pointer:
            return m_pointer ? "pointer" : "null";
        case Function:
            return "function";
        case File:
            return "file";
    }
    return "unknown";
}

const Value& Value::at(const std::string& k) const {
    if (my_type == Object) {
        auto it = m_object_map.find(k);
        if (it != m_object_map.end()) return it->second;
    }
    std::ostringstream ss;
    ss << "Could not find key <" << k << "> available options are: ";
    bool first = true;
    for (auto const& p : m_object_map) {
        if (!first) ss << ",";
        first = false;
        ss << '"' << p.first << '"';
    }
    throw std::out_of_range(ss.str());
}

Value& Value::at(const std::string& k) {
    return const_cast<Value&>(static_cast<const Value&>(*this).at(k));
}

const Value* Value::find(const Value& key) const {
    if (my_type == Map) {
        for (auto const& e : m_entries)
            if (e.first == key) return &e.second;
        return nullptr;
    }
    if (my_type == Object && key.isString()) {
        auto it = m_object_map.find(key.m_string);
        return it == m_object_map.end() ? nullptr : &it->second;
    }
    return nullptr;
}

bool Value::insert(Value v) {
    if (my_type == Null) my_type = Set;
    if (my_type != Set) throw std::logic_error("Cannot insert an element into " + typeString());
    for (auto const& e : m_array)
        if (e == v) return false;
    m_array.push_back(std::move(v));
    return true;
}

void Value::insert(Value key, Value v) {
    if (my_type == Null) my_type = Map;
    if (my_type != Map) throw std::logic_error("Cannot insert an entry into " + typeString());
    for (auto& e : m_entries) {
        if (e.first == key) {
            e.second = std::move(v);
            return;
        }
    }
    m_entries.emplace_back(std::move(key), std::move(v));
}

int compare_bigint(const std::string& a, const std::string& b) {
    bool neg_a = !a.empty() && a[0] == '-';
    bool neg_b = !b.empty() && b[0] == '-';
    if (neg_a != neg_b) return neg_a ? -1 : 1;
    std::string ma = neg_a ? a.substr(1) : a;
    std::string mb = neg_b ? b.substr(1) : b;
    int cmp = 0;
    if (ma.size() != mb.size())
        cmp = ma.size() < mb.size() ? -1 : 1;
    else
        cmp = ma < mb ? -1 : (ma > mb ? 1 : 0);
    return neg_a ? -cmp : cmp;
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s)
        if ((c & 0xC0) != 0x80) ++n;
    return n;
}

namespace {
    bool is_numeric(const Value& v) { return v.isInt() || v.isDouble() || v.isBigInt(); }

    bool numbers_equal(const Value& a, const Value& b) {
        if (a.isInt() && b.isInt()) return a.asInt() == b.asInt();
        if (a.isDouble() && b.isDouble()) {
            double x = a.asDouble();
            double y = b.asDouble();
            if (std::isnan(x) && std::isnan(y)) return true;
            return x == y;
        }
        if (a.isDouble() || b.isDouble()) {
            // an integral double equals an integer or bigint of the same magnitude
            const Value& d = a.isDouble() ? a : b;
            const Value& i = a.isDouble() ? b : a;
            double dv = d.asDouble();
            if (!std::isfinite(dv) || std::trunc(dv) != dv) return false;
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(0) << dv;
            return compare_bigint(ss.str(), i.asBigInt()) == 0;
        }
        return compare_bigint(a.asBigInt(), b.asBigInt()) == 0;
    }

    std::string escape_json_string(const std::string& s) {
        std::string result;
        result.reserve(s.size() + 2);
        result.push_back('"');
        for (char c : s) {
            switch (c) {
                case '"':
                    result += "\\\"";
                    break;
                case '\\':
                    result += "\\\\";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                default:
                    result.push_back(c);
                    break;
            }
        }
        result.push_back('"');
        return result;
    }

    std::string format_double(double x) {
        if (std::isnan(x)) return "NaN";
        if (std::isinf(x)) return x > 0 ? "Infinity" : "-Infinity";
        std::ostringstream ss;
        ss << std::setprecision(17) << x;
        std::string s = ss.str();
        // prefer the shortest representation that round-trips
        for (int p = 1; p < 17; ++p) {
            std::ostringstream t;
            t << std::setprecision(p) << x;
            if (std::stod(t.str()) == x) return t.str();
        }
        return s;
    }

    void dump_value(const Value& v, std::ostringstream& out, int indent, int level);

    void newline(std::ostringstream& out, int indent, int level) {
        if (indent <= 0) return;
        out << '\n' << std::string(static_cast<size_t>(indent * level), ' ');
    }

    void dump_value(const Value& v, std::ostringstream& out, int indent, int level) {
        switch (v.type()) {
            case Value::Null:
                out << "null";
                return;
            case Value::Boolean:
                out << (v.asBool() ? "true" : "false");
                return;
            case Value::Integer:
                out << v.asInt();
                return;
            case Value::Double:
                out << format_double(v.asDouble());
                return;
            case Value::BigInt:
                out << v.asBigInt() << 'n';
                return;
            case Value::String:
                out << escape_json_string(v.asString());
                return;
            case Value::Array:
            case Value::Set: {
                if (v.isSet()) out << "Set";
                out << '[';
                bool first = true;
                for (auto const& e : v.asArray()) {
                    if (!first) out << ',';
                    first = false;
                    newline(out, indent, level + 1);
                    dump_value(e, out, indent, level + 1);
                }
                if (!v.empty()) newline(out, indent, level);
                out << ']';
                return;
            }
            case Value::Object: {
                out << '{';
                bool first = true;
                for (auto const& p : v.asObject()) {
                    if (!first) out << ',';
                    first = false;
                    newline(out, indent, level + 1);
                    out << escape_json_string(p.first) << (indent > 0 ? ": " : ":");
                    dump_value(p.second, out, indent, level + 1);
                }
                if (!v.empty()) newline(out, indent, level);
                out << '}';
                return;
            }
            case Value::Map: {
                out << "Map{";
                bool first = true;
                for (auto const& e : v.asEntries()) {
                    if (!first) out << ',';
                    first = false;
                    newline(out, indent, level + 1);
                    dump_value(e.first, out, indent, level + 1);
                    out << " => ";
                    dump_value(e.second, out, indent, level + 1);
                }
                if (!v.empty()) newline(out, indent, level);
                out << '}';
                return;
            }
            case Value::Pointer:
                if (!v.pointee()) {
                    out << "null";
                    return;
                }
                out << '&';
                dump_value(*v.pointee(), out, indent, level);
                return;
            case Value::Function:
                out << "<function>";
                return;
            case Value::File:
                out << "<file " << escape_json_string(v.asFile().name) << ' ' << v.asFile().size << " bytes>";
                return;
        }
    }
}  // namespace

bool Value::operator==(const Value& rhs) const {
    if (is_numeric(*this) && is_numeric(rhs)) return numbers_equal(*this, rhs);
    if (my_type != rhs.my_type) return false;
    switch (my_type) {
        case Null:
            return true;
        case Boolean:
            return m_bool == rhs.m_bool;
        case String:
            return m_string == rhs.m_string;
        case Array:
            return m_array == rhs.m_array;
        case Set: {
            if (m_array.size() != rhs.m_array.size()) return false;
            for (auto const& e : m_array) {
                bool found = false;
                for (auto const& o : rhs.m_array)
                    if (e == o) {
                        found = true;
                        break;
                    }
                if (!found) return false;
            }
            return true;
        }
        case Object:
            return m_object_map == rhs.m_object_map;
        case Map: {
            if (m_entries.size() != rhs.m_entries.size()) return false;
            for (auto const& e : m_entries) {
                const Value* other = rhs.find(e.first);
                if (!other || *other != e.second) return false;
            }
            return true;
        }
        case Pointer:
            if (!m_pointer || !rhs.m_pointer) return m_pointer == rhs.m_pointer;
            return *m_pointer == *rhs.m_pointer;
        case Function:
            return m_function == rhs.m_function;
        case File:
            return m_file->name == rhs.m_file->name && m_file->size == rhs.m_file->size &&
                   m_file->mime == rhs.m_file->mime;
        default:
            break;
    }
    return false;
}

std::string Value::dump(int indent) const {
    std::ostringstream out;
    dump_value(*this, out, indent, 0);
    return out.str();
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
    os << v.dump();
    return os;
}

}  // namespace sc
