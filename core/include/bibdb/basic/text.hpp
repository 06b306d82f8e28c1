// bibdb/basic/text.hpp - Small ASCII text helpers shared by parser and model
#pragma once

#include <string>
#include <string_view>

namespace bibdb
{

/// Lower-case ASCII letters; other bytes (including UTF-8) are kept as is
[[nodiscard]] inline std::string to_lower_ascii(std::string_view s)
{
  std::string out(s);
  for (char & c : out) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return out;
}

}  // namespace bibdb
