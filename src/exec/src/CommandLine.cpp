/**
 * @file CommandLine.cpp
 * @brief CommandLine rendering.
 */

#include "src/exec/inc/CommandLine.hpp"

namespace kindling {

namespace exec {

std::string CommandLine::display() const {
  std::string out;
  for (std::size_t i = 0; i < argv_.size(); ++i) {
    if (i != 0) {
      out += ' ';
    }
    out += argv_[i];
  }
  return out;
}

} // namespace exec

} // namespace kindling
