#include "trustchain/time_util.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace trustchain {

namespace {

bool readDigits(std::string_view text, size_t& pos, size_t count, int& out) {
  if (pos + count > text.size()) return false;
  int value = 0;
  for (size_t i = 0; i < count; ++i) {
    char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    value = value * 10 + (c - '0');
  }
  pos += count;
  out = value;
  return true;
}

bool expect(std::string_view text, size_t& pos, char c) {
  if (pos >= text.size() || text[pos] != c) return false;
  ++pos;
  return true;
}

}  // namespace

std::string formatRfc3339(TimePoint tp) {
  auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  if (secs > tp) {
    secs -= std::chrono::seconds(1);
  }
  auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();

  std::time_t t = Clock::to_time_t(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, static_cast<int>(millis));
  return buf;
}

std::optional<TimePoint> parseRfc3339(std::string_view text) {
  size_t pos = 0;
  std::tm tm{};
  int year = 0, month = 0, day = 0;
  if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, day)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31) {
    return std::nullopt;
  }
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;

  std::chrono::milliseconds fraction{0};
  std::chrono::seconds offset{0};

  if (pos < text.size()) {
    if (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ') {
      return std::nullopt;
    }
    ++pos;
    int hour = 0, minute = 0, second = 0;
    if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, minute)) {
      return std::nullopt;
    }
    if (pos < text.size() && text[pos] == ':') {
      ++pos;
      if (!readDigits(text, pos, 2, second)) return std::nullopt;
    }
    if (hour > 23 || minute > 59 || second > 60) {
      return std::nullopt;
    }
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      int scale = 100;
      int ms = 0;
      size_t digits = 0;
      while (pos < text.size() &&
             std::isdigit(static_cast<unsigned char>(text[pos]))) {
        if (scale > 0) {
          ms += (text[pos] - '0') * scale;
          scale /= 10;
        }
        ++pos;
        ++digits;
      }
      if (digits == 0) return std::nullopt;
      fraction = std::chrono::milliseconds(ms);
    }

    if (pos < text.size()) {
      char zone = text[pos];
      if (zone == 'Z' || zone == 'z') {
        ++pos;
      } else if (zone == '+' || zone == '-') {
        ++pos;
        int oh = 0, om = 0;
        if (!readDigits(text, pos, 2, oh)) return std::nullopt;
        expect(text, pos, ':');
        if (!readDigits(text, pos, 2, om)) return std::nullopt;
        auto total = std::chrono::hours(oh) + std::chrono::minutes(om);
        offset = zone == '+' ? total : -total;
      } else {
        return std::nullopt;
      }
    }
  }

  if (pos != text.size()) {
    return std::nullopt;
  }

  std::time_t t = timegm(&tm);
  if (t == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return Clock::from_time_t(t) + fraction - offset;
}

}  // namespace trustchain
