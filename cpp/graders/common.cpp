#include "common.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace recall::graders {
namespace {

constexpr char32_t kInvalid = 0xFFFFFFFF;

// Decodes one UTF-8 sequence starting at `pos`. Malformed bytes decode to kInvalid and
// consume a single byte so they survive re-encoding untouched.
char32_t decode_one(std::string_view text, std::size_t& pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t length = 0;
  char32_t cp = 0;
  if (lead < 0x80) {
    ++pos;
    return lead;
  }
  if ((lead & 0xE0) == 0xC0) {
    length = 2;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    cp = lead & 0x07;
  } else {
    ++pos;
    return kInvalid;
  }
  if (pos + length > text.size()) {
    ++pos;
    return kInvalid;
  }
  for (std::size_t i = 1; i < length; ++i) {
    const auto cont = static_cast<unsigned char>(text[pos + i]);
    if ((cont & 0xC0) != 0x80) {
      ++pos;
      return kInvalid;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }
  pos += length;
  return cp;
}

void encode_one(char32_t cp, std::string& out) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool is_space(char32_t cp) {
  switch (cp) {
    case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D: case 0x20:
    case 0x85: case 0xA0: case 0x1680: case 0x2028: case 0x2029:
    case 0x202F: case 0x205F: case 0x3000: case 0xFEFF:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

char32_t fold_latin_extended_a(char32_t cp) {
  if (cp == 0x0130 || cp == 0x0131 || cp == 0x0138 || cp == 0x0149) {
    return cp;
  }
  if (cp == 0x0178) {
    return 0x00FF;
  }
  if (cp == 0x017F) {
    return U's';
  }
  // Ĺ..ň and Ź..ž put the capital on the odd code point.
  if ((cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E)) {
    return (cp % 2 == 1) ? cp + 1 : cp;
  }
  return (cp % 2 == 0) ? cp + 1 : cp;
}

char32_t fold_simple(char32_t cp) {
  if (cp >= U'A' && cp <= U'Z') {
    return cp + 0x20;
  }
  if (cp < 0x80) {
    return cp;
  }
  if (cp == 0x00B5) {
    return 0x03BC;
  }
  if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) {
    return cp + 0x20;
  }
  if (cp >= 0x0100 && cp <= 0x017F) {
    return fold_latin_extended_a(cp);
  }
  if (cp == 0x0386) {
    return 0x03AC;
  }
  if (cp >= 0x0388 && cp <= 0x038A) {
    return cp + 0x25;
  }
  if (cp == 0x038C) {
    return 0x03CC;
  }
  if (cp == 0x038E || cp == 0x038F) {
    return cp + 0x3F;
  }
  if (cp >= 0x0391 && cp <= 0x03AB && cp != 0x03A2) {
    return cp + 0x20;
  }
  if (cp == 0x03C2) {
    return 0x03C3;
  }
  if (cp >= 0x0400 && cp <= 0x040F) {
    return cp + 0x50;
  }
  if (cp >= 0x0410 && cp <= 0x042F) {
    return cp + 0x20;
  }
  return cp;
}

} // namespace

std::string trim_text(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end) {
    std::size_t next = begin;
    if (!is_space(decode_one(text, next))) {
      break;
    }
    begin = next;
  }
  // Walk back over whole sequences: find the last non-space code point.
  std::size_t last_kept = begin;
  std::size_t pos = begin;
  while (pos < end) {
    const char32_t cp = decode_one(text, pos);
    if (!is_space(cp)) {
      last_kept = pos;
    }
  }
  return std::string(text.substr(begin, last_kept - begin));
}

std::string fold_case(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t start = pos;
    const char32_t cp = decode_one(text, pos);
    if (cp == kInvalid) {
      out.append(text.substr(start, pos - start));
      continue;
    }
    if (cp == 0x00DF || cp == 0x1E9E) {
      out.append("ss");
      continue;
    }
    encode_one(fold_simple(cp), out);
  }
  return out;
}

std::string normalize_text(std::string_view text) {
  return fold_case(trim_text(text));
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out.append(separator);
    }
    out.append(parts[i]);
  }
  return out;
}

std::string format_number(double value) {
  if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 1e15) {
    return std::to_string(static_cast<long long>(value));
  }
  std::ostringstream oss;
  oss << std::setprecision(10) << value;
  return oss.str();
}

} // namespace recall::graders
