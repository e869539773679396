#pragma once

#include <cstdint>
#include <string>

namespace ffweave {

/**
 * @brief Media timestamp / interval stored as integer microseconds.
 *
 * Arithmetic is exact (no float drift when scenes are split and re-joined).
 * Formatting follows ffmpeg's seconds syntax ("5.0", "1.25").
 */
class Timestamp final {
public:
  constexpr Timestamp() = default;

  static constexpr Timestamp from_micros(int64_t us) { return Timestamp(us); }
  static constexpr Timestamp from_millis(int64_t ms) { return Timestamp(ms * 1000); }
  static Timestamp from_seconds(double s);

  // Accepts "123.5", "01:02.5", "1:02:03.250".
  // @throws std::invalid_argument on malformed input.
  static Timestamp parse(const std::string& text);

  constexpr int64_t micros() const { return us_; }
  constexpr int64_t millis() const { return us_ / 1000; }
  double seconds() const { return static_cast<double>(us_) / 1e6; }

  std::string to_string() const;

  constexpr bool is_zero() const { return us_ == 0; }

  constexpr Timestamp operator+(Timestamp o) const { return Timestamp(us_ + o.us_); }
  constexpr Timestamp operator-(Timestamp o) const { return Timestamp(us_ - o.us_); }
  constexpr Timestamp operator-() const { return Timestamp(-us_); }
  Timestamp& operator+=(Timestamp o) {
    us_ += o.us_;
    return *this;
  }
  Timestamp& operator-=(Timestamp o) {
    us_ -= o.us_;
    return *this;
  }

  constexpr bool operator==(Timestamp o) const { return us_ == o.us_; }
  constexpr bool operator!=(Timestamp o) const { return us_ != o.us_; }
  constexpr bool operator<(Timestamp o) const { return us_ < o.us_; }
  constexpr bool operator<=(Timestamp o) const { return us_ <= o.us_; }
  constexpr bool operator>(Timestamp o) const { return us_ > o.us_; }
  constexpr bool operator>=(Timestamp o) const { return us_ >= o.us_; }

private:
  constexpr explicit Timestamp(int64_t us) : us_(us) {}

  int64_t us_ = 0;
};

inline Timestamp min_ts(Timestamp a, Timestamp b) { return a < b ? a : b; }
inline Timestamp max_ts(Timestamp a, Timestamp b) { return a < b ? b : a; }

} // namespace ffweave
