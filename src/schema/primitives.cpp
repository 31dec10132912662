#include <mnemo/schema/primitives.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <chrono>
#include <iterator>

namespace mnemo::schema {

namespace {

bool parse_digits(std::string_view text,
                  const size_t offset,
                  const size_t count,
                  int& out) {
  if (offset + count > text.size()) {
    return false;
  }
  const auto* begin = text.data() + offset;
  const auto* end = begin + count;
  for (const auto* it = begin; it != end; ++it) {
    if (*it < '0' || *it > '9') {
      return false;
    }
  }
  auto [ptr, ec] = std::from_chars(begin, end, out);
  return ec == std::errc{} && ptr == end;
}

bool expect_char(std::string_view text, const size_t offset, const char c) {
  return offset < text.size() && text[offset] == c;
}

}  // namespace

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{make_string_view(bytes)};
}

std::string format_timestamp(const timestamp_milliseconds_t value) {
  using namespace std::chrono;
  const auto point = sys_time<milliseconds>{milliseconds{value}};
  const auto day_point = floor<days>(point);
  const auto date = year_month_day{day_point};
  const auto time = hh_mm_ss<milliseconds>{point - day_point};
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                     static_cast<int>(date.year()),
                     static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()), time.hours().count(),
                     time.minutes().count(), time.seconds().count(),
                     time.subseconds().count());
}

std::optional<timestamp_milliseconds_t> try_parse_timestamp(
    std::string_view value) {
  using namespace std::chrono;
  auto year_value = 0;
  auto month_value = 0;
  auto day_value = 0;
  auto hour_value = 0;
  auto minute_value = 0;
  auto second_value = 0;
  if (!parse_digits(value, 0, 4, year_value) || !expect_char(value, 4, '-') ||
      !parse_digits(value, 5, 2, month_value) ||
      !expect_char(value, 7, '-') || !parse_digits(value, 8, 2, day_value)) {
    return std::nullopt;
  }

  auto date = year_month_day{year{year_value},
                             month{static_cast<unsigned>(month_value)},
                             day{static_cast<unsigned>(day_value)}};
  if (!date.ok()) {
    return std::nullopt;
  }

  auto offset = size_t{10};
  auto millis = 0;
  auto zone_offset_minutes = 0;
  if (offset < value.size()) {
    if (!expect_char(value, offset, 'T') && !expect_char(value, offset, ' ')) {
      return std::nullopt;
    }
    if (!parse_digits(value, 11, 2, hour_value) ||
        !expect_char(value, 13, ':') ||
        !parse_digits(value, 14, 2, minute_value) ||
        !expect_char(value, 16, ':') ||
        !parse_digits(value, 17, 2, second_value)) {
      return std::nullopt;
    }
    if (hour_value > 23 || minute_value > 59 || second_value > 60) {
      return std::nullopt;
    }
    offset = 19;
    if (expect_char(value, offset, '.')) {
      ++offset;
      auto digits = 0;
      while (offset < value.size() && value[offset] >= '0' &&
             value[offset] <= '9') {
        if (digits < 3) {
          millis = millis * 10 + (value[offset] - '0');
        }
        ++digits;
        ++offset;
      }
      if (digits == 0) {
        return std::nullopt;
      }
      for (; digits < 3; ++digits) {
        millis *= 10;
      }
    }
    if (expect_char(value, offset, 'Z')) {
      ++offset;
    } else if (expect_char(value, offset, '+') ||
               expect_char(value, offset, '-')) {
      const auto sign = value[offset] == '-' ? -1 : 1;
      auto zone_hours = 0;
      auto zone_minutes = 0;
      if (!parse_digits(value, offset + 1, 2, zone_hours) ||
          !expect_char(value, offset + 3, ':') ||
          !parse_digits(value, offset + 4, 2, zone_minutes)) {
        return std::nullopt;
      }
      zone_offset_minutes = sign * (zone_hours * 60 + zone_minutes);
      offset += 6;
    }
    if (offset != value.size()) {
      return std::nullopt;
    }
  }

  auto point = sys_days{date} + hours{hour_value} + minutes{minute_value} +
               seconds{second_value} + milliseconds{millis} -
               minutes{zone_offset_minutes};
  return duration_cast<milliseconds>(point.time_since_epoch()).count();
}

std::string make_uuid() {
  thread_local auto generator = boost::uuids::random_generator{};
  return boost::uuids::to_string(generator());
}

}  // namespace mnemo::schema
