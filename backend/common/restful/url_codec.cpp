#include "url_codec.hpp"

namespace common {

namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool isAttrChar(unsigned char c) {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
    return true;
  }
  switch (c) {
    case '!': case '#': case '$': case '&': case '+': case '-':
    case '.': case '^': case '_': case '`': case '|': case '~':
      return true;
    default:
      return false;
  }
}

bool isPlainAscii(std::string_view input) {
  for (unsigned char c : input) {
    if (c < 0x20 || c >= 0x7f || c == '"' || c == '\\') {
      return false;
    }
  }
  return true;
}

} // namespace

std::string percentDecode(std::string_view input, bool plus_as_space) {
  std::string out;
  out.reserve(input.size());
  for (size_t i = 0; i < input.size(); ++i) {
    char c = input[i];
    if (c == '%' && i + 2 < input.size()) {
      int hi = hexValue(input[i + 1]);
      int lo = hexValue(input[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    if (c == '+' && plus_as_space) {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

RequestTarget parseTarget(std::string_view target) {
  RequestTarget result;
  auto qpos = target.find('?');
  result.path = std::string(target.substr(0, qpos));
  if (qpos == std::string_view::npos) {
    return result;
  }

  auto query = target.substr(qpos + 1);
  auto hash = query.find('#');
  if (hash != std::string_view::npos) {
    query = query.substr(0, hash);
  }

  while (!query.empty()) {
    auto amp = query.find('&');
    auto pair = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
    if (pair.empty()) {
      continue;
    }
    auto eq = pair.find('=');
    auto key = percentDecode(pair.substr(0, eq), true);
    auto value = eq == std::string_view::npos ? std::string{} : percentDecode(pair.substr(eq + 1), true);
    result.query.emplace(std::move(key), std::move(value));
  }
  return result;
}

std::string percentEncodeAttrChars(std::string_view input) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(input.size() * 3);
  for (unsigned char c : input) {
    if (isAttrChar(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::string attachmentDisposition(std::string_view filename) {
  if (!filename.empty() && isPlainAscii(filename)) {
    return "attachment; filename=\"" + std::string(filename) + "\"";
  }

  std::string fallback;
  for (unsigned char c : filename) {
    if (c >= 0x20 && c < 0x7f && c != '"' && c != '\\') {
      fallback.push_back(static_cast<char>(c));
    }
  }
  if (fallback.empty()) {
    fallback = "download";
  }
  return "attachment; filename=\"" + fallback + "\"; filename*=UTF-8''" + percentEncodeAttrChars(filename);
}

} // namespace common
