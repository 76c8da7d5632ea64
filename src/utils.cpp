#include "edfrec/utils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace edfrec {

static inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
  size_t b = 0;
  while (b < s.size() && is_space(s[b])) ++b;
  size_t e = s.size();
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == delim) {
      out.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  out.push_back(cur);
  return out;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int to_int(const std::string& s) {
  try {
    const std::string t = trim(s);
    size_t idx = 0;
    int v = std::stoi(t, &idx, 10);
    if (idx == 0) throw std::invalid_argument("no digits");
    if (idx != t.size()) throw std::invalid_argument("trailing characters");
    return v;
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse int from '" + s + "': " + e.what());
  }
}

double to_double(const std::string& s) {
  try {
    const std::string t = trim(s);
    if (t.empty()) throw std::invalid_argument("empty");

    std::istringstream iss(t);
    iss.imbue(std::locale::classic());
    double v = 0.0;
    iss >> v;
    if (!iss) throw std::invalid_argument("invalid");
    iss >> std::ws;
    if (!iss.eof()) throw std::invalid_argument("trailing characters");
    return v;
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse double from '" + s + "': " + e.what());
  }
}

std::string utf8_to_latin1(const std::string& utf8) {
  std::string out;
  out.reserve(utf8.size());

  size_t i = 0;
  while (i < utf8.size()) {
    const unsigned char b0 = static_cast<unsigned char>(utf8[i]);
    if (b0 == 0x00) {
      ++i;
      continue;
    }
    if (b0 < 0x80) {
      out.push_back(static_cast<char>(b0));
      ++i;
      continue;
    }

    size_t n = 0;
    unsigned cp = 0;
    if ((b0 & 0xE0) == 0xC0) {
      n = 2;
      cp = b0 & 0x1Fu;
    } else if ((b0 & 0xF0) == 0xE0) {
      n = 3;
      cp = b0 & 0x0Fu;
    } else if ((b0 & 0xF8) == 0xF0) {
      n = 4;
      cp = b0 & 0x07u;
    }

    bool valid = n > 0 && i + n <= utf8.size();
    for (size_t k = 1; valid && k < n; ++k) {
      const unsigned char c = static_cast<unsigned char>(utf8[i + k]);
      if ((c & 0xC0) != 0x80) {
        valid = false;
      } else {
        cp = (cp << 6) | (c & 0x3Fu);
      }
    }

    if (!valid) {
      out.push_back('?');
      ++i;
      continue;
    }

    out.push_back(cp <= 0xFFu ? static_cast<char>(cp) : '?');
    i += n;
  }
  return out;
}

std::string latin1_to_utf8(const std::string& latin1) {
  std::string out;
  out.reserve(latin1.size());
  for (char c : latin1) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (uc < 0x80) {
      out.push_back(c);
    } else {
      out.push_back(static_cast<char>(0xC0u | (uc >> 6)));
      out.push_back(static_cast<char>(0x80u | (uc & 0x3Fu)));
    }
  }
  return out;
}

std::string latin1_to_header_ascii(const std::string& latin1) {
  // Base letters for 0xC0..0xFF (0 = no sensible folding).
  static const char kFold[64] = {
      'A', 'A', 'A', 'A', 'A', 'A', 'E', 'C', 'E', 'E', 'E', 'E', 'I', 'I', 'I', 'I',
      'D', 'N', 'O', 'O', 'O', 'O', 'O', 0,   'O', 'U', 'U', 'U', 'U', 'Y', 0,   's',
      'a', 'a', 'a', 'a', 'a', 'a', 'e', 'c', 'e', 'e', 'e', 'e', 'i', 'i', 'i', 'i',
      'd', 'n', 'o', 'o', 'o', 'o', 'o', 0,   'o', 'u', 'u', 'u', 'u', 'y', 0,   'y'};

  std::string out;
  out.reserve(latin1.size());
  for (char c : latin1) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (uc >= 0x20 && uc <= 0x7E) {
      out.push_back(c);
    } else if (uc >= 0xC0 && kFold[uc - 0xC0] != 0) {
      out.push_back(kFold[uc - 0xC0]);
    } else {
      out.push_back('_');
    }
  }
  return out;
}

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (unsigned char uc : s) {
    char c = static_cast<char>(uc);
    switch (c) {
    case '\\': out += "\\\\"; break;
    case '"': out += "\\\""; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (uc < 0x20) {
        std::ostringstream oss;
        oss << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
            << static_cast<int>(uc);
        out += oss.str();
      } else {
        out.push_back(c);
      }
      break;
    }
  }
  return out;
}

bool localtime_safe(std::time_t t, std::tm* out) {
#if defined(_WIN32)
  return out && localtime_s(out, &t) == 0;
#else
  return out && localtime_r(&t, out) != nullptr;
#endif
}

} // namespace edfrec
