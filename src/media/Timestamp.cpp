#include "ffweave/media/Timestamp.h"

#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace ffweave {
namespace {

constexpr std::size_t kMaxFieldDigits = 12;
// Whole seconds that still fit in microseconds, fraction included.
constexpr int64_t kMaxSeconds = std::numeric_limits<int64_t>::max() / 1000000 - 1;

int64_t parse_int_field(const std::string& field, const std::string& text) {
  if (field.empty()) {
    throw std::invalid_argument("Timestamp::parse: empty field in '" + text + "'");
  }
  if (field.size() > kMaxFieldDigits) {
    throw std::invalid_argument("Timestamp::parse: field too long in '" + text + "'");
  }
  int64_t v = 0;
  for (char c : field) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw std::invalid_argument("Timestamp::parse: bad character in '" + text + "'");
    }
    v = v * 10 + (c - '0');
  }
  return v;
}

} // namespace

Timestamp Timestamp::from_seconds(double s) {
  return Timestamp(static_cast<int64_t>(std::llround(s * 1e6)));
}

Timestamp Timestamp::parse(const std::string& text) {
  std::string s = text;
  bool negative = false;
  if (!s.empty() && s[0] == '-') {
    negative = true;
    s = s.substr(1);
  }
  if (s.empty()) {
    throw std::invalid_argument("Timestamp::parse: empty value");
  }

  std::string whole = s;
  std::string frac;
  const std::size_t dot = s.find('.');
  if (dot != std::string::npos) {
    whole = s.substr(0, dot);
    frac = s.substr(dot + 1);
  }

  std::vector<std::string> parts;
  std::size_t b = 0;
  while (true) {
    const std::size_t colon = whole.find(':', b);
    if (colon == std::string::npos) {
      parts.push_back(whole.substr(b));
      break;
    }
    parts.push_back(whole.substr(b, colon - b));
    b = colon + 1;
  }
  if (parts.size() > 3) {
    throw std::invalid_argument("Timestamp::parse: too many fields in '" + text + "'");
  }

  int64_t seconds = 0;
  for (const auto& p : parts) {
    seconds = seconds * 60 + parse_int_field(p, text);
  }
  if (seconds > kMaxSeconds) {
    throw std::invalid_argument("Timestamp::parse: '" + text + "' is out of range");
  }

  int64_t us = seconds * 1000000;
  if (!frac.empty()) {
    // Keep microsecond precision, ignore the rest.
    int64_t scale = 100000;
    for (std::size_t i = 0; i < frac.size() && scale > 0; ++i) {
      const char c = frac[i];
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        throw std::invalid_argument("Timestamp::parse: bad fraction in '" + text + "'");
      }
      us += (c - '0') * scale;
      scale /= 10;
    }
  }
  return Timestamp(negative ? -us : us);
}

std::string Timestamp::to_string() const {
  const int64_t abs_us = us_ < 0 ? -us_ : us_;
  std::ostringstream ss;
  if (us_ < 0) ss << '-';
  ss << (abs_us / 1000000) << '.';

  std::string frac = std::to_string(abs_us % 1000000);
  frac.insert(0, 6 - frac.size(), '0');
  while (frac.size() > 1 && frac.back() == '0') frac.pop_back();
  ss << frac;
  return ss.str();
}

} // namespace ffweave
