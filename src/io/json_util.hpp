#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyforge::json
{

// Minimal JSON reader/writer for the formats keyforge writes itself
// (documents, clipboard payloads, configuration). Not a general-purpose
// JSON library: values are handled as raw text slices and decoded on demand.

// Top-level members of an object, key -> raw value text.
using Fields = std::map<std::string, std::string, std::less<>>;

// ─── Writing ─────────────────────────────────────────────────────────────────

// Quoted, escaped string literal.
std::string quote(std::string_view s);

// Shortest text that parses back to the same float. Non-finite values are
// written as 0.
std::string number(float v);
std::string number(double v);

inline const char* boolean(bool b)
{
    return b ? "true" : "false";
}

// ─── Reading ─────────────────────────────────────────────────────────────────

// nullopt if `text` is not a well-formed object.
std::optional<Fields> parse_object(std::string_view text);

// Raw element slices of an array; nullopt if `text` is not a well-formed array.
std::optional<std::vector<std::string>> parse_array(std::string_view text);

std::optional<std::string> as_string(std::string_view raw);
std::optional<double>      as_number(std::string_view raw);
std::optional<bool>        as_bool(std::string_view raw);
bool                       is_null(std::string_view raw);

// ─── Narrowing ───────────────────────────────────────────────────────────────

// nullopt when `v` lies outside the finite float range.
std::optional<float> to_float(double v);

// nullopt unless `v` is a whole number in [1, UINT32_MAX - 1]. The top value
// is excluded so the next id after the largest one stays valid.
std::optional<uint32_t> to_id(double v);

// Clamped in double space, so any finite input is safe to pass.
int to_int_clamped(double v, int lo, int hi);

// Field accessors; the fallback is returned when the key is missing or has
// the wrong type.
std::string read_string(const Fields& f, std::string_view key, const std::string& fallback = "");
double      read_number(const Fields& f, std::string_view key, double fallback = 0.0);
bool        read_bool(const Fields& f, std::string_view key, bool fallback = false);

// Like read_number(), but the fallback is also returned when the value does
// not fit in a float.
float read_float(const Fields& f, std::string_view key, float fallback);

// nullopt when missing, null, or not a number.
std::optional<double> read_optional_number(const Fields& f, std::string_view key);

// nullopt when missing or not a valid id (see to_id()).
std::optional<uint32_t> read_id(const Fields& f, std::string_view key);

// Raw slice of a member, or nullopt.
std::optional<std::string> read_raw(const Fields& f, std::string_view key);

}  // namespace keyforge::json
