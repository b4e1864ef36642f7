#include "json_raw.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace keysync::util {
namespace {

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

char FoldAscii(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool ReadHex4(std::string_view s, size_t pos, std::uint32_t* out) {
  if (pos + 4 > s.size()) return false;
  std::uint32_t v = 0;
  for (size_t i = pos; i < pos + 4; ++i) {
    const int d = HexDigit(s[i]);
    if (d < 0) return false;
    v = (v << 4) | static_cast<std::uint32_t>(d);
  }
  *out = v;
  return true;
}

void AppendUtf8(std::uint32_t cp, std::string* out) {
  if (cp < 0x80) {
    out->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Decodes the body of a JSON string (without quotes). Lone surrogates
// become U+FFFD.
std::optional<std::string> Unescape(std::string_view raw) {
  if (raw.find('\\') == std::string_view::npos) {
    return std::string(raw);
  }

  std::string out;
  out.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\\') {
      out.push_back(raw[i]);
      continue;
    }
    if (++i >= raw.size()) return std::nullopt;
    switch (raw[i]) {
      case '"': out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      case '/': out.push_back('/'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!ReadHex4(raw, i + 1, &cp)) return std::nullopt;
        i += 4;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          std::uint32_t low = 0;
          if (i + 2 < raw.size() && raw[i + 1] == '\\' && raw[i + 2] == 'u' && ReadHex4(raw, i + 3, &low) &&
              low >= 0xDC00 && low <= 0xDFFF) {
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            i += 6;
          } else {
            cp = 0xFFFD;
          }
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          cp = 0xFFFD;
        }
        AppendUtf8(cp, &out);
        break;
      }
      default:
        return std::nullopt;
    }
  }
  return out;
}

class Scanner {
 public:
  explicit Scanner(std::string_view text) : text_(text) {
  }

  size_t Pos() const {
    return pos_;
  }

  bool AtEnd() const {
    return pos_ >= text_.size();
  }

  char Peek() const {
    return AtEnd() ? '\0' : text_[pos_];
  }

  void SkipSpace() {
    while (!AtEnd() && IsSpace(text_[pos_])) ++pos_;
  }

  bool Consume(char c) {
    if (Peek() != c) return false;
    ++pos_;
    return true;
  }

  // Positioned on the opening quote; leaves pos_ after the closing quote.
  bool SkipString() {
    if (!Consume('"')) return false;
    while (!AtEnd()) {
      const char c = text_[pos_++];
      if (c == '\\') {
        if (AtEnd()) return false;
        ++pos_;
      } else if (c == '"') {
        return true;
      }
    }
    return false;
  }

  bool SkipValue() {
    switch (Peek()) {
      case '"':
        return SkipString();
      case '{':
      case '[':
        return SkipContainer();
      case '\0':
        return false;
      default:
        // number, true, false, null
        while (!AtEnd()) {
          const char c = text_[pos_];
          if (c == ',' || c == '}' || c == ']' || IsSpace(c)) break;
          ++pos_;
        }
        return true;
    }
  }

 private:
  bool SkipContainer() {
    int depth = 0;
    while (!AtEnd()) {
      const char c = text_[pos_];
      if (c == '"') {
        if (!SkipString()) return false;
        continue;
      }
      ++pos_;
      if (c == '{' || c == '[') {
        ++depth;
      } else if (c == '}' || c == ']') {
        if (--depth == 0) return true;
      }
    }
    return false;
  }

  std::string_view text_;
  size_t           pos_ = 0;
};

} // namespace

bool EqualFoldAscii(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (FoldAscii(a[i]) != FoldAscii(b[i])) {
      return false;
    }
  }
  return true;
}

std::optional<std::string_view> FindTopLevelMember(std::string_view json, std::string_view key) {
  Scanner scan(json);
  scan.SkipSpace();
  if (!scan.Consume('{')) {
    return std::nullopt;
  }

  std::optional<std::string_view> exact;
  std::optional<std::string_view> folded;

  scan.SkipSpace();
  if (scan.Consume('}')) {
    return std::nullopt;
  }

  for (;;) {
    scan.SkipSpace();
    const size_t key_start = scan.Pos();
    if (!scan.SkipString()) {
      return std::nullopt;
    }
    const auto member_key = Unescape(json.substr(key_start + 1, scan.Pos() - key_start - 2));
    if (!member_key) {
      return std::nullopt;
    }

    scan.SkipSpace();
    if (!scan.Consume(':')) {
      return std::nullopt;
    }
    scan.SkipSpace();

    const size_t value_start = scan.Pos();
    if (!scan.SkipValue()) {
      return std::nullopt;
    }
    const auto value = json.substr(value_start, scan.Pos() - value_start);

    if (*member_key == key) {
      exact = value;
    } else if (EqualFoldAscii(*member_key, key)) {
      folded = value;
    }

    scan.SkipSpace();
    if (scan.Consume(',')) {
      continue;
    }
    break;
  }

  return exact ? exact : folded;
}

} // namespace keysync::util
