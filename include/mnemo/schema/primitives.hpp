#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mnemo::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using memory_id_t = std::string;
using timestamp_milliseconds_t = int64_t;
using duration_milliseconds_t = int64_t;
using embedding_t = std::vector<double>;
using tag_list_t = std::vector<std::string>;

/// Free-form key/value pair attached to audit entries.
using attribute_t = std::pair<std::string, std::string>;
using attribute_list_t = std::vector<attribute_t>;

inline constexpr auto kMillisecondsPerSecond = timestamp_milliseconds_t{1000};
inline constexpr auto kMillisecondsPerHour =
    timestamp_milliseconds_t{60 * 60 * 1000};
inline constexpr auto kMillisecondsPerDay = 24 * kMillisecondsPerHour;

/// 9999-12-31T23:59:59.999Z, the last instant `format_timestamp` renders in
/// four-digit years.
inline constexpr auto kMaxTimestamp = timestamp_milliseconds_t{253402300799999};

bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Format milliseconds since the Unix epoch as `YYYY-MM-DDTHH:MM:SS.mmmZ`.
std::string format_timestamp(timestamp_milliseconds_t value);

/// Parse an ISO-8601 UTC timestamp. Accepts an optional fractional second
/// part and either `Z` or a `+HH:MM`/`-HH:MM` offset. Returns std::nullopt
/// when the text is not a valid timestamp.
std::optional<timestamp_milliseconds_t> try_parse_timestamp(
    std::string_view value);

/// Random UUIDv4 rendered in canonical lowercase form.
std::string make_uuid();

}  // namespace mnemo::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
