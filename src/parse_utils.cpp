#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

static std::string lowered(const std::string& value) {
    std::string val = value;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return val;
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = lowered(value);
    if (val.empty())
        return 0;
    unsigned long long mult = 1;
    auto ends_with = [&](const std::string& suf) {
        return val.size() >= suf.size() &&
               val.compare(val.size() - suf.size(), suf.size(), suf) == 0;
    };
    if (ends_with("kb") || ends_with("mb") || ends_with("gb") || ends_with("tb"))
        val.pop_back();
    else if (val.back() == 'b')
        val.pop_back();
    if (!val.empty()) {
        switch (val.back()) {
        case 'k':
            mult = 1024ull;
            break;
        case 'm':
            mult = 1024ull * 1024;
            break;
        case 'g':
            mult = 1024ull * 1024 * 1024;
            break;
        case 't':
            mult = 1024ull * 1024 * 1024 * 1024;
            break;
        default:
            break;
        }
        if (mult != 1)
            val.pop_back();
    }
    if (val.empty() || !std::all_of(val.begin(), val.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; }))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::out_of_range&) {
        return 0;
    }
    if (base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

bool parse_bool(const std::string& value, bool& ok) {
    ok = true;
    std::string v = lowered(value);
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}
