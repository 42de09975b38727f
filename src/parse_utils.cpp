#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

namespace {

std::string lower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

bool all_digits(const std::string& v) {
    return !v.empty() &&
           std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool ends_with(const std::string& v, const std::string& suf) {
    return v.size() >= suf.size() && v.compare(v.size() - suf.size(), suf.size(), suf) == 0;
}

} // namespace

unsigned int parse_uint(const std::string& value, unsigned int min, unsigned int max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    try {
        unsigned long v = std::stoul(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<unsigned int>(v);
    } catch (const std::exception&) {
        return 0;
    }
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = lower(value);
    if (ends_with(val, "b"))
        val.pop_back();
    unsigned long long mult = 1;
    if (ends_with(val, "k")) {
        mult = 1024ull;
        val.pop_back();
    } else if (ends_with(val, "m")) {
        mult = 1024ull * 1024;
        val.pop_back();
    } else if (ends_with(val, "g")) {
        mult = 1024ull * 1024 * 1024;
        val.pop_back();
    }
    if (!all_digits(val))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::exception&) {
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

std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok) {
    ok = false;
    std::string val = lower(value);
    long long mult = 1000;
    if (ends_with(val, "ms")) {
        mult = 1;
        val.erase(val.size() - 2);
    } else if (ends_with(val, "s")) {
        val.pop_back();
    } else if (ends_with(val, "m")) {
        mult = 60 * 1000;
        val.pop_back();
    } else if (ends_with(val, "h")) {
        mult = 60 * 60 * 1000;
        val.pop_back();
    }
    if (!all_digits(val))
        return std::chrono::milliseconds(0);
    long long n = 0;
    try {
        n = std::stoll(val);
    } catch (const std::exception&) {
        return std::chrono::milliseconds(0);
    }
    if (n > LLONG_MAX / mult)
        return std::chrono::milliseconds(0);
    ok = true;
    return std::chrono::milliseconds(n * mult);
}

bool parse_bool(const std::string& value, bool& ok) {
    ok = true;
    std::string v = lower(value);
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}
