#include "formtext/TextUtils.hpp"

#include <algorithm>

#include <utf8cpp/utf8.h>

namespace formtext {
namespace text {

std::vector<std::size_t> codePointOffsets(const std::string &text) {
  std::vector<std::size_t> offsets;
  offsets.reserve(text.size() + 1);

  auto it = text.begin();
  while (it != text.end()) {
    offsets.push_back(static_cast<std::size_t>(it - text.begin()));
    try {
      utf8::next(it, text.end());
    } catch (const utf8::exception &) {
      // A malformed byte counts as one character; next() leaves it in place
      ++it;
    }
  }

  offsets.push_back(text.size());
  return offsets;
}

std::size_t codePointLength(const std::string &text) {
  return codePointOffsets(text).size() - 1;
}

std::string removeUnderscores(const std::string &text) {
  std::string result = text;
  result.erase(std::remove(result.begin(), result.end(), '_'), result.end());
  return result;
}

std::string joinNonEmpty(const std::vector<std::string> &parts,
                         const std::string &separator) {
  std::string result;
  for (const auto &part : parts) {
    if (part.empty())
      continue;
    if (!result.empty())
      result += separator;
    result += part;
  }
  return result;
}

} // namespace text
} // namespace formtext
