#include <sc/check.h>
#include <algorithm>
#include <cctype>
#include <map>
#include <regex>

namespace sc {

namespace {
    const char* const ipv4_pattern =
        R"((?:(?:25[0-5]|2[0-4][0-9]|1[0-9][0-9]|[1-9][0-9]|[0-9])\.){3}(?:25[0-5]|2[0-4][0-9]|1[0-9][0-9]|[1-9][0-9]|[0-9]))";

    const char* const ipv6_pattern =
        R"((([0-9a-fA-F]{1,4}:){7}[0-9a-fA-F]{1,4}|([0-9a-fA-F]{1,4}:){1,7}:|([0-9a-fA-F]{1,4}:){1,6}:[0-9a-fA-F]{1,4}|)"
        R"(([0-9a-fA-F]{1,4}:){1,5}(:[0-9a-fA-F]{1,4}){1,2}|([0-9a-fA-F]{1,4}:){1,4}(:[0-9a-fA-F]{1,4}){1,3}|)"
        R"(([0-9a-fA-F]{1,4}:){1,3}(:[0-9a-fA-F]{1,4}){1,4}|([0-9a-fA-F]{1,4}:){1,2}(:[0-9a-fA-F]{1,4}){1,5}|)"
        R"([0-9a-fA-F]{1,4}:((:[0-9a-fA-F]{1,4}){1,6})|:((:[0-9a-fA-F]{1,4}){1,7}|:)|)"
        R"(fe80:(:[0-9a-fA-F]{0,4}){0,4}%[0-9a-zA-Z]{1,}|)"
        R"(::(ffff(:0{1,4}){0,1}:){0,1}((25[0-5]|(2[0-4]|1{0,1}[0-9]){0,1}[0-9])\.){3,3}(25[0-5]|(2[0-4]|1{0,1}[0-9]){0,1}[0-9])|)"
        R"(([0-9a-fA-F]{1,4}:){1,4}:((25[0-5]|(2[0-4]|1{0,1}[0-9]){0,1}[0-9])\.){3,3}(25[0-5]|(2[0-4]|1{0,1}[0-9]){0,1}[0-9])))";

    // Leap-year aware YYYY-MM-DD
    const char* const date_pattern =
        R"((?:(?:\d\d[2468][048]|\d\d[13579][26]|\d\d0[48]|[02468][048]00|[13579][26]00)-02-29|)"
        R"(\d{4}-(?:(?:0[13578]|1[02])-(?:0[1-9]|[12]\d|3[01])|(?:0[469]|11)-(?:0[1-9]|[12]\d|30)|(?:02)-(?:0[1-9]|1\d|2[0-8]))))";

    const char* const time_pattern = R"((?:[01]\d|2[0-3]):[0-5]\d(?::[0-5]\d(?:\.\d+)?)?)";

    std::map<std::string, std::regex> build_formats() {
        const std::string ipv4 = ipv4_pattern;
        const std::string ipv6 = ipv6_pattern;
        const std::string date = date_pattern;
        const std::string time = time_pattern;

        std::map<std::string, std::regex> f;
        f["email"] = std::regex(
            R"(^[A-Za-z0-9_'+\-]+([A-Za-z0-9_'+\-]*\.[A-Za-z0-9_'+\-]+)*@[A-Za-z0-9]([A-Za-z0-9\-]*[A-Za-z0-9])?(\.[A-Za-z0-9]([A-Za-z0-9\-]*[A-Za-z0-9])?)*\.[A-Za-z]{2,}$)");
        f["url"] = std::regex(R"(^[a-zA-Z][a-zA-Z0-9+.-]*://[^\s/$.?#].[^\s]*$)");
        f["uuid"] = std::regex(
            R"(^([0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[1-8][0-9a-fA-F]{3}-[89abAB][0-9a-fA-F]{3}-[0-9a-fA-F]{12}|00000000-0000-0000-0000-000000000000)$)");
        f["ipv4"] = std::regex("^" + ipv4 + "$");
        f["ipv6"] = std::regex("^(?:" + ipv6 + ")$");
        f["cidrv4"] = std::regex("^" + ipv4 + R"(\/([0-9]|[1-2][0-9]|3[0-2])$)");
        f["cidrv6"] = std::regex("^(?:" + ipv6 + R"()\/(12[0-8]|1[01][0-9]|[1-9]?[0-9])$)");
        f["hostname"] = std::regex(
            R"(^[a-zA-Z0-9](?:[a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?(?:\.[a-zA-Z0-9](?:[-0-9a-zA-Z]{0,61}[0-9a-zA-Z])?)*\.?$)");
        f["date"] = std::regex("^" + date + "$");
        f["time"] = std::regex("^" + time + "$");
        f["datetime"] = std::regex("^" + date + "T" + time + R"((?:Z|[+-](?:[01]\d|2[0-3]):[0-5]\d)$)");
        f["duration"] =
            std::regex(R"(^P(?:(\d+W)|(\d+Y)?(\d+M)?(\d+D)?(?:T(\d+H)?(\d+M)?(\d+(?:[.,]\d+)?S)?)?)$)");
        return f;
    }

    // Upper bounds on input length for each regex format. libstdc++ matches
    // recursively, one frame per character, so unbounded input can exhaust
    // the stack.
    size_t max_length(const std::string& format) {
        static const std::map<std::string, size_t> limits = {
            {"email", 320},    {"url", 2048},    {"uuid", 36},   {"ipv4", 15},     {"ipv6", 64},
            {"cidrv4", 18},    {"cidrv6", 68},   {"hostname", 253}, {"date", 10}, {"time", 32},
            {"datetime", 64},  {"duration", 64},
        };
        auto it = limits.find(format);
        return it == limits.end() ? max_regex_input : it->second;
    }

    bool is_base64(const std::string& s) {
        if (s.size() % 4 != 0) return false;
        size_t padding = 0;
        for (size_t i = 0; i < s.size(); ++i) {
            const char c = s[i];
            if (c == '=') {
                ++padding;
                continue;
            }
            if (padding > 0) return false;
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '/') return false;
        }
        return padding <= 2;
    }

    const std::map<std::string, std::regex>& formats() {
        static const std::map<std::string, std::regex> table = build_formats();
        return table;
    }
}  // namespace

bool is_format_name(const std::string& format) {
    return formats().count(format) == 1 || format == "base64" || format == "lowercase" || format == "uppercase";
}

bool matches_format(const std::string& format, const std::string& s) {
    if (format == "lowercase") return std::none_of(s.begin(), s.end(), [](char c) { return c >= 'A' && c <= 'Z'; });
    if (format == "uppercase") return std::none_of(s.begin(), s.end(), [](char c) { return c >= 'a' && c <= 'z'; });
    if (format == "base64") return is_base64(s);
    auto it = formats().find(format);
    if (it == formats().end()) throw std::invalid_argument("unknown string format '" + format + "'");
    if (s.size() > max_length(format)) return false;
    // "P" alone matches the duration grammar but names no component
    if (format == "duration" && (s == "P" || (!s.empty() && s.back() == 'T'))) return false;
    return std::regex_match(s, it->second);
}

}  // namespace sc
