/**
 * @file Threshold.cpp
 * @brief Threshold range parsing and evaluation.
 */

#include "src/plugin/inc/Threshold.hpp"

#include <cmath>   // std::isfinite
#include <cstdlib> // std::strtod
#include <utility> // std::move

#include <fmt/core.h>

namespace swapcheck {

namespace plugin {

namespace {

/* ----------------------------- Number Parsing ----------------------------- */

/// Parse a signed decimal ("-1", "+2.5", "80", ".5"). Rejects inf/nan/hex forms.
bool parseBound(std::string_view text, double& out) noexcept {
  if (text.empty()) {
    return false;
  }

  bool sawDigit = false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char C = text[i];
    if (C >= '0' && C <= '9') {
      sawDigit = true;
    } else if ((C == '-' || C == '+') && i == 0) {
      continue;
    } else if (C != '.' && C != 'e' && C != 'E' && C != '-' && C != '+') {
      return false;
    }
  }
  if (!sawDigit) {
    return false;
  }

  // Copy into a terminated buffer for strtod
  char buf[64];
  if (text.size() >= sizeof(buf)) {
    return false;
  }
  text.copy(buf, text.size());
  buf[text.size()] = '\0';

  char* end = nullptr;
  const double VAL = std::strtod(buf, &end);
  if (end != buf + text.size() || !std::isfinite(VAL)) {
    return false;
  }

  out = VAL;
  return true;
}

} // namespace

/* ----------------------------- ThresholdRange ----------------------------- */

bool ThresholdRange::shouldAlert(double value) const noexcept {
  const bool BELOW = !startInfinite && value < start;
  const bool ABOVE = !endInfinite && value > end;
  const bool OUTSIDE = BELOW || ABOVE;
  return alertInside ? !OUTSIDE : OUTSIDE;
}

bool parseRange(std::string_view text, ThresholdRange& out, std::string& error) {
  if (text.empty()) {
    error = "empty range";
    return false;
  }

  ThresholdRange range{};
  std::string_view rest = text;

  if (rest.front() == '@') {
    range.alertInside = true;
    rest.remove_prefix(1);
  }

  const std::size_t COLON = rest.find(':');
  if (COLON == std::string_view::npos) {
    // "N": 0..N
    if (!parseBound(rest, range.end)) {
      error = fmt::format("invalid range '{}'", text);
      return false;
    }
    range.endInfinite = false;
  } else {
    const std::string_view LOW = rest.substr(0, COLON);
    const std::string_view HIGH = rest.substr(COLON + 1);

    if (LOW == "~") {
      range.startInfinite = true;
    } else if (!LOW.empty() && !parseBound(LOW, range.start)) {
      error = fmt::format("invalid range '{}'", text);
      return false;
    }

    if (HIGH.empty()) {
      range.endInfinite = true;
    } else if (parseBound(HIGH, range.end)) {
      range.endInfinite = false;
    } else {
      error = fmt::format("invalid range '{}'", text);
      return false;
    }
  }

  if (!range.startInfinite && !range.endInfinite && range.start > range.end) {
    error = fmt::format("invalid range '{}': start is greater than end", text);
    return false;
  }

  out = range;
  return true;
}

/* ----------------------------- Thresholds ----------------------------- */

bool parseThresholds(std::optional<std::string_view> warningText,
                     std::optional<std::string_view> criticalText, Thresholds& out,
                     std::string& error) {
  Thresholds parsed{};
  std::string why;

  if (warningText) {
    ThresholdRange range{};
    if (!parseRange(*warningText, range, why)) {
      error = fmt::format("Invalid warning threshold: {}", why);
      return false;
    }
    parsed.warning = range;
    parsed.warningText.assign(*warningText);
  }

  if (criticalText) {
    ThresholdRange range{};
    if (!parseRange(*criticalText, range, why)) {
      error = fmt::format("Invalid critical threshold: {}", why);
      return false;
    }
    parsed.critical = range;
    parsed.criticalText.assign(*criticalText);
  }

  out = std::move(parsed);
  return true;
}

Status checkThresholds(double value, const Thresholds& thresholds) noexcept {
  if (thresholds.critical && thresholds.critical->shouldAlert(value)) {
    return Status::CRITICAL;
  }
  if (thresholds.warning && thresholds.warning->shouldAlert(value)) {
    return Status::WARNING;
  }
  return Status::OK;
}

} // namespace plugin

} // namespace swapcheck
