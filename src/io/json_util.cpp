#include "io/json_util.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>

namespace keyforge::json
{

// ─── Writing ─────────────────────────────────────────────────────────────────

std::string quote(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    out += '"';
    return out;
}

std::string number(float v)
{
    if (!std::isfinite(v))
        return "0";
    char buf[32];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, res.ptr);
}

std::string number(double v)
{
    if (!std::isfinite(v))
        return "0";
    char buf[32];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, res.ptr);
}

// ─── Scanner ─────────────────────────────────────────────────────────────────

namespace
{

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

size_t skip_space(std::string_view s, size_t pos)
{
    while (pos < s.size() && is_space(s[pos]))
        ++pos;
    return pos;
}

// Position one past the closing quote of the string starting at `pos`, or npos.
size_t scan_string(std::string_view s, size_t pos)
{
    if (pos >= s.size() || s[pos] != '"')
        return std::string_view::npos;
    for (size_t i = pos + 1; i < s.size(); ++i)
    {
        if (s[i] == '\\')
        {
            ++i;
            continue;
        }
        if (s[i] == '"')
            return i + 1;
    }
    return std::string_view::npos;
}

// Position one past the value starting at `pos`, or npos when malformed.
size_t scan_value(std::string_view s, size_t pos)
{
    if (pos >= s.size())
        return std::string_view::npos;

    char c = s[pos];
    if (c == '"')
        return scan_string(s, pos);

    if (c == '{' || c == '[')
    {
        int depth = 0;
        for (size_t i = pos; i < s.size(); ++i)
        {
            char d = s[i];
            if (d == '"')
            {
                i = scan_string(s, i);
                if (i == std::string_view::npos)
                    return i;
                --i;
            }
            else if (d == '{' || d == '[')
            {
                ++depth;
            }
            else if (d == '}' || d == ']')
            {
                if (--depth == 0)
                    return i + 1;
            }
        }
        return std::string_view::npos;
    }

    size_t end = pos;
    while (end < s.size() && s[end] != ',' && s[end] != '}' && s[end] != ']' && !is_space(s[end]))
        ++end;
    return end == pos ? std::string_view::npos : end;
}

std::string_view trim(std::string_view s)
{
    size_t b = skip_space(s, 0);
    size_t e = s.size();
    while (e > b && is_space(s[e - 1]))
        --e;
    return s.substr(b, e - b);
}

}  // anonymous namespace

// ─── Reading ─────────────────────────────────────────────────────────────────

std::optional<Fields> parse_object(std::string_view text)
{
    text = trim(text);
    if (text.size() < 2 || text.front() != '{' || text.back() != '}')
        return std::nullopt;

    Fields fields;
    size_t pos = skip_space(text, 1);
    if (text[pos] == '}')
        return fields;

    while (pos < text.size())
    {
        size_t key_end = scan_string(text, pos);
        if (key_end == std::string_view::npos)
            return std::nullopt;
        auto key = as_string(text.substr(pos, key_end - pos));
        if (!key)
            return std::nullopt;

        pos = skip_space(text, key_end);
        if (pos >= text.size() || text[pos] != ':')
            return std::nullopt;
        pos = skip_space(text, pos + 1);

        size_t value_end = scan_value(text, pos);
        if (value_end == std::string_view::npos)
            return std::nullopt;
        fields[*key] = std::string(text.substr(pos, value_end - pos));

        pos = skip_space(text, value_end);
        if (pos >= text.size())
            return std::nullopt;
        if (text[pos] == '}')
            return fields;
        if (text[pos] != ',')
            return std::nullopt;
        pos = skip_space(text, pos + 1);
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> parse_array(std::string_view text)
{
    text = trim(text);
    if (text.size() < 2 || text.front() != '[' || text.back() != ']')
        return std::nullopt;

    std::vector<std::string> items;
    size_t                   pos = skip_space(text, 1);
    if (text[pos] == ']')
        return items;

    while (pos < text.size())
    {
        size_t value_end = scan_value(text, pos);
        if (value_end == std::string_view::npos)
            return std::nullopt;
        items.emplace_back(text.substr(pos, value_end - pos));

        pos = skip_space(text, value_end);
        if (pos >= text.size())
            return std::nullopt;
        if (text[pos] == ']')
            return items;
        if (text[pos] != ',')
            return std::nullopt;
        pos = skip_space(text, pos + 1);
    }
    return std::nullopt;
}

std::optional<std::string> as_string(std::string_view raw)
{
    raw = trim(raw);
    if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"')
        return std::nullopt;

    std::string out;
    out.reserve(raw.size() - 2);
    for (size_t i = 1; i + 1 < raw.size(); ++i)
    {
        char c = raw[i];
        if (c != '\\')
        {
            out += c;
            continue;
        }
        if (++i + 1 > raw.size() - 1)
            return std::nullopt;
        switch (raw[i])
        {
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            case '"':
            case '\\':
            case '/':
                out += raw[i];
                break;
            default:
                return std::nullopt;
        }
    }
    return out;
}

std::optional<double> as_number(std::string_view raw)
{
    raw = trim(raw);
    if (raw.empty())
        return std::nullopt;
    double v   = 0.0;
    auto   res = std::from_chars(raw.data(), raw.data() + raw.size(), v);
    if (res.ec != std::errc() || res.ptr != raw.data() + raw.size() || !std::isfinite(v))
        return std::nullopt;
    return v;
}

std::optional<bool> as_bool(std::string_view raw)
{
    raw = trim(raw);
    if (raw == "true")
        return true;
    if (raw == "false")
        return false;
    return std::nullopt;
}

bool is_null(std::string_view raw)
{
    return trim(raw) == "null";
}

std::string read_string(const Fields& f, std::string_view key, const std::string& fallback)
{
    auto it = f.find(key);
    if (it == f.end())
        return fallback;
    return as_string(it->second).value_or(fallback);
}

double read_number(const Fields& f, std::string_view key, double fallback)
{
    auto it = f.find(key);
    if (it == f.end())
        return fallback;
    return as_number(it->second).value_or(fallback);
}

bool read_bool(const Fields& f, std::string_view key, bool fallback)
{
    auto it = f.find(key);
    if (it == f.end())
        return fallback;
    return as_bool(it->second).value_or(fallback);
}

std::optional<double> read_optional_number(const Fields& f, std::string_view key)
{
    auto it = f.find(key);
    if (it == f.end())
        return std::nullopt;
    return as_number(it->second);
}

std::optional<uint32_t> read_id(const Fields& f, std::string_view key)
{
    auto v = read_optional_number(f, key);
    if (!v)
        return std::nullopt;
    return to_id(*v);
}

float read_float(const Fields& f, std::string_view key, float fallback)
{
    auto v = read_optional_number(f, key);
    if (!v)
        return fallback;
    return to_float(*v).value_or(fallback);
}

// ─── Narrowing ───────────────────────────────────────────────────────────────

std::optional<float> to_float(double v)
{
    constexpr double limit = std::numeric_limits<float>::max();
    if (!std::isfinite(v) || v > limit || v < -limit)
        return std::nullopt;
    return static_cast<float>(v);
}

std::optional<uint32_t> to_id(double v)
{
    constexpr double limit = std::numeric_limits<uint32_t>::max() - 1.0;
    if (!std::isfinite(v) || v < 1.0 || v > limit || std::floor(v) != v)
        return std::nullopt;
    return static_cast<uint32_t>(v);
}

int to_int_clamped(double v, int lo, int hi)
{
    if (std::isnan(v))
        return lo;
    return static_cast<int>(std::clamp(v, static_cast<double>(lo), static_cast<double>(hi)));
}

std::optional<std::string> read_raw(const Fields& f, std::string_view key)
{
    auto it = f.find(key);
    if (it == f.end())
        return std::nullopt;
    return it->second;
}

}  // namespace keyforge::json
