/**
 * @file PerfData.cpp
 * @brief Performance data rendering.
 */

#include "src/plugin/inc/PerfData.hpp"

namespace swapcheck {

namespace plugin {

std::string quoteLabel(std::string_view label) {
  if (label.find_first_of(" ='") == std::string_view::npos) {
    return std::string(label);
  }

  std::string out;
  out.reserve(label.size() + 4);
  out.push_back('\'');
  for (const char C : label) {
    if (C == '\'') {
      out.push_back('\'');
    }
    out.push_back(C);
  }
  out.push_back('\'');
  return out;
}

std::string PerfDatum::toString() const {
  std::string out = quoteLabel(label);
  out.push_back('=');
  out.append(value).append(unit);
  out.push_back(';');
  out.append(warning);
  out.push_back(';');
  out.append(critical);
  return out;
}

} // namespace plugin

} // namespace swapcheck
