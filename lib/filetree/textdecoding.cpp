#include "textdecoding.hpp"

#include <cstddef>
#include <locale>
#include <stdexcept>

namespace {

constexpr const char *REPLACEMENT = "\xEF\xBF\xBD";

/**
 * @brief Length of the well-formed sequence starting at pos
 *
 * @return Sequence length (1..4) if well-formed, otherwise 0 with
 *         invalid_len set to the number of bytes to replace (at least 1)
 */
std::size_t sequenceLength(std::string_view s, std::size_t pos,
                           std::size_t &invalid_len) {
  auto byte = [&](std::size_t i) { return static_cast<unsigned char>(s[i]); };
  const unsigned char lead = byte(pos);
  invalid_len = 1;

  if (lead < 0x80)
    return 1;

  std::size_t len = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;

  if (lead >= 0xC2 && lead <= 0xDF) {
    len = 2;
  } else if (lead == 0xE0) {
    len = 3;
    lo = 0xA0;
  } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
    len = 3;
  } else if (lead == 0xED) {
    len = 3;
    hi = 0x9F; // no surrogates
  } else if (lead == 0xF0) {
    len = 4;
    lo = 0x90;
  } else if (lead >= 0xF1 && lead <= 0xF3) {
    len = 4;
  } else if (lead == 0xF4) {
    len = 4;
    hi = 0x8F;
  } else {
    return 0;
  }

  for (std::size_t k = 1; k < len; ++k) {
    if (pos + k >= s.size()) {
      invalid_len = k;
      return 0;
    }
    const unsigned char c = byte(pos + k);
    const unsigned char min = (k == 1) ? lo : 0x80;
    const unsigned char max = (k == 1) ? hi : 0xBF;
    if (c < min || c > max) {
      invalid_len = k;
      return 0;
    }
  }
  return len;
}

/**
 * @brief Code point of the well-formed sequence of length len at pos
 */
wchar_t decodeSequence(std::string_view s, std::size_t pos, std::size_t len) {
  auto byte = [&](std::size_t i) {
    return static_cast<wchar_t>(static_cast<unsigned char>(s[pos + i]));
  };

  switch (len) {
  case 1:
    return byte(0);
  case 2:
    return ((byte(0) & 0x1F) << 6) | (byte(1) & 0x3F);
  case 3:
    return ((byte(0) & 0x0F) << 12) | ((byte(1) & 0x3F) << 6) |
           (byte(2) & 0x3F);
  default:
    return ((byte(0) & 0x07) << 18) | ((byte(1) & 0x3F) << 12) |
           ((byte(2) & 0x3F) << 6) | (byte(3) & 0x3F);
  }
}

/**
 * @brief Locale whose wide ctype facet knows the Unicode case mappings
 *
 * Tries the UTF-8 C locale first, then the user's locale. With neither
 * available only ASCII letters are folded.
 */
const std::locale &foldingLocale() {
  static const std::locale locale = [] {
    for (const char *name : {"C.UTF-8", "C.utf8", ""}) {
      try {
        return std::locale(name);
      } catch (const std::runtime_error &) {
        continue; // not installed
      }
    }
    return std::locale::classic();
  }();
  return locale;
}

} // namespace

std::wstring foldCase(std::string_view name) {
  std::wstring folded;
  folded.reserve(name.size());

  std::size_t pos = 0;
  while (pos < name.size()) {
    std::size_t invalid_len = 0;
    std::size_t len = sequenceLength(name, pos, invalid_len);
    if (len == 0) {
      // Undecodable bytes keep a stable position: U+DC80..U+DCFF
      for (std::size_t k = 0; k < invalid_len; ++k) {
        folded.push_back(static_cast<wchar_t>(
            0xDC00 + static_cast<unsigned char>(name[pos + k])));
      }
      pos += invalid_len;
    } else {
      folded.push_back(decodeSequence(name, pos, len));
      pos += len;
    }
  }

  const auto &ctype = std::use_facet<std::ctype<wchar_t>>(foldingLocale());
  if (!folded.empty())
    ctype.tolower(&folded[0], &folded[0] + folded.size());
  return folded;
}

std::string decodeUtf8Lossy(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());

  std::size_t pos = 0;
  while (pos < bytes.size()) {
    std::size_t invalid_len = 0;
    std::size_t len = sequenceLength(bytes, pos, invalid_len);
    if (len == 0) {
      out += REPLACEMENT;
      pos += invalid_len;
    } else {
      out.append(bytes.data() + pos, len);
      pos += len;
    }
  }
  return out;
}

bool isValidUtf8(std::string_view bytes) {
  std::size_t pos = 0;
  while (pos < bytes.size()) {
    std::size_t invalid_len = 0;
    std::size_t len = sequenceLength(bytes, pos, invalid_len);
    if (len == 0)
      return false;
    pos += len;
  }
  return true;
}
