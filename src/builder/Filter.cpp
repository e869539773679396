// src/builder/Filter.cpp
#include "ffweave/builder/Filter.h"

#include "ffweave/builder/Stream.h"

#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace ffweave {

bool is_omitted(const ParamValue& v) {
  return std::visit(
      [](const auto& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return true;
        } else if constexpr (std::is_same_v<T, std::string>) {
          return x.empty();
        } else if constexpr (std::is_same_v<T, Timestamp>) {
          return x.is_zero();
        } else {
          return x == 0;
        }
      },
      v);
}

std::string render_value(const ParamValue& v) {
  return std::visit(
      [](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return x;
        } else if constexpr (std::is_same_v<T, Timestamp>) {
          return x.to_string();
        } else if constexpr (std::is_same_v<T, double>) {
          std::ostringstream oss;
          oss << x;
          return oss.str();
        } else {
          return std::to_string(x);
        }
      },
      v);
}

Filter::Filter(std::vector<StreamKind> input_kinds, std::vector<StreamKind> output_kinds)
  : Node(std::move(input_kinds), std::move(output_kinds)) {}

std::string Filter::args() const {
  std::string out;
  for (const auto& p : params()) {
    if (is_omitted(p.value)) continue;
    if (!out.empty()) out += ':';
    if (!p.name.empty()) out += p.name + "=";
    out += render_value(p.value);
  }
  return out;
}

std::string Filter::render() const {
  const std::string a = args();
  return a.empty() ? filter_name() : filter_name() + "=" + a;
}

std::optional<Meta> Filter::output_meta(std::size_t slot) const {
  if (slot >= outputs_.size()) {
    throw std::out_of_range(kind() + ": invalid output slot " + std::to_string(slot));
  }
  if (propagating_) return std::nullopt;
  struct Guard {
    bool& flag;
    explicit Guard(bool& f) : flag(f) { flag = true; }
    ~Guard() { flag = false; }
  } guard(propagating_);

  std::vector<Meta> metas;
  metas.reserve(inputs_.size());
  for (Stream* in : inputs_) {
    if (!in) return std::nullopt;
    auto m = in->meta();
    if (!m) return std::nullopt;
    metas.push_back(std::move(*m));
  }
  auto out = transform(metas);
  if (slot >= out.size()) return std::nullopt;
  return std::move(out[slot]);
}

bool Filter::same_as(const Filter& other) const {
  return kind() == other.kind() && render() == other.render() &&
         input_count() == other.input_count() && output_count() == other.output_count();
}

std::vector<Meta> Filter::transform(const std::vector<Meta>& metas) const {
  if (metas.empty()) return {};
  return std::vector<Meta>(outputs_.size(), metas.front());
}

void Filter::on_inputs_bound() {
  validate_inputs();
  // Transform errors surface at connection time.
  (void)output_meta(0);
}

} // namespace ffweave
