#pragma once
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

namespace authbridge::internal {

// Monotonic timestamp helper for latency measurements (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

// Wall-clock seconds since epoch, compared against JWT exp/nbf claims.
inline int64_t WallClockSeconds() {
  using namespace std::chrono;
  return static_cast<int64_t>(
      duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

inline std::string Trim(std::string_view s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return std::string(s.substr(start, end - start + 1));
}

inline bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool EndsWith(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

inline std::string ToLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

// Cut `s` to at most `max_bytes` without splitting a UTF-8 sequence.
inline std::string TruncateUtf8(std::string_view s, size_t max_bytes) {
  if (s.size() <= max_bytes) return std::string(s);
  size_t cut = max_bytes;
  // Back up over continuation bytes (10xxxxxx).
  while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return std::string(s.substr(0, cut));
}

// Base64url (RFC 4648 section 5) decode using OpenSSL's EVP block decoder.
// Accepts input with or without padding. Returns false on malformed input.
inline bool Base64UrlDecode(std::string_view in, std::string* out) {
  std::string b64;
  b64.reserve(in.size() + 3);
  for (char c : in) {
    if (c == '-') {
      b64.push_back('+');
    } else if (c == '_') {
      b64.push_back('/');
    } else if (c == '=') {
      break;
    } else if (std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/') {
      b64.push_back(c);
    } else {
      return false;
    }
  }
  if (b64.size() % 4 == 1) return false;
  size_t padding = 0;
  while (b64.size() % 4 != 0) {
    b64.push_back('=');
    ++padding;
  }
  if (b64.empty()) {
    out->clear();
    return true;
  }

  std::vector<unsigned char> buf(b64.size() / 4 * 3);
  int n = EVP_DecodeBlock(buf.data(),
                          reinterpret_cast<const unsigned char*>(b64.data()),
                          static_cast<int>(b64.size()));
  if (n < 0 || static_cast<size_t>(n) < padding) return false;
  out->assign(reinterpret_cast<const char*>(buf.data()),
              static_cast<size_t>(n) - padding);
  return true;
}

// Base64url encode without padding.
inline std::string Base64UrlEncode(std::string_view in) {
  if (in.empty()) return "";
  std::vector<unsigned char> buf(4 * ((in.size() + 2) / 3) + 1);
  int n = EVP_EncodeBlock(buf.data(),
                          reinterpret_cast<const unsigned char*>(in.data()),
                          static_cast<int>(in.size()));
  std::string out(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
  while (!out.empty() && out.back() == '=') out.pop_back();
  for (char& c : out) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  return out;
}

}  // namespace authbridge::internal
