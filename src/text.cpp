/**
 * @file text.cpp
 * @brief String helper implementation
 */

#include "clip_job/text.hpp"

#include <locale.h>
#include <wctype.h>

#include "clip_job/logging.hpp"

namespace clip_job {

namespace {

constexpr const char *WHITESPACE = " \t\n\r\f\v";

/// UTF-8 aware ctype locale, or nullptr when none is installed
locale_t utf8_locale() {
  static locale_t loc = [] {
    locale_t l = newlocale(LC_CTYPE_MASK, "C.UTF-8", static_cast<locale_t>(0));
    if (l == static_cast<locale_t>(0))
      l = newlocale(LC_CTYPE_MASK, "en_US.UTF-8", static_cast<locale_t>(0));
    if (l == static_cast<locale_t>(0))
      LOG_WARN("No UTF-8 locale installed; non-ASCII letters keep their case");
    return l;
  }();
  return loc;
}

/// Decode one code point at text[pos]; returns its byte length (0 = invalid)
size_t decode_utf8(const std::string &text, size_t pos, char32_t &cp) {
  auto byte = [&](size_t i) {
    return static_cast<unsigned char>(text[pos + i]);
  };
  unsigned char lead = byte(0);
  size_t len;
  if (lead < 0x80) {
    cp = lead;
    return 1;
  } else if ((lead & 0xE0) == 0xC0) {
    len = 2;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    len = 3;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    len = 4;
    cp = lead & 0x07;
  } else {
    return 0;
  }
  if (pos + len > text.size())
    return 0;
  for (size_t i = 1; i < len; ++i) {
    if ((byte(i) & 0xC0) != 0x80)
      return 0;
    cp = (cp << 6) | (byte(i) & 0x3F);
  }
  return len;
}

void encode_utf8(char32_t cp, std::string &out) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

} // anonymous namespace

std::string trim(const std::string &text) {
  size_t first = text.find_first_not_of(WHITESPACE);
  if (first == std::string::npos)
    return {};
  size_t last = text.find_last_not_of(WHITESPACE);
  return text.substr(first, last - first + 1);
}

std::string to_lower(const std::string &text) {
  std::string out;
  out.reserve(text.size());

  locale_t loc = utf8_locale();
  size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    size_t len = decode_utf8(text, pos, cp);
    if (len == 0) {
      /// Invalid sequence: copy the byte through
      out += text[pos++];
      continue;
    }

    if (cp < 0x80) {
      if (cp >= 'A' && cp <= 'Z')
        cp += 'a' - 'A';
      encode_utf8(cp, out);
    } else if (loc != static_cast<locale_t>(0)) {
      encode_utf8(static_cast<char32_t>(
                      towlower_l(static_cast<wint_t>(cp), loc)),
                  out);
    } else {
      out.append(text, pos, len);
    }
    pos += len;
  }
  return out;
}

std::string replace_all(std::string text, const std::string &from,
                        const std::string &to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

} // namespace clip_job
