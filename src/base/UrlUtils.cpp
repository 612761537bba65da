#include "UrlUtils.hpp"

namespace wt {
namespace {
int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}
}  // namespace

UrlUtils::ParsedTarget UrlUtils::parseTarget(const string& target) {
  ParsedTarget parsed;
  size_t question = target.find('?');
  parsed.path = target.substr(0, question);
  if (question == string::npos) {
    return parsed;
  }
  for (const auto& pair : split(target.substr(question + 1), '&')) {
    if (pair.empty()) {
      continue;
    }
    size_t equals = pair.find('=');
    string key = decode(pair.substr(0, equals), true);
    string value =
        equals == string::npos ? "" : decode(pair.substr(equals + 1), true);
    // First occurrence wins
    parsed.query.insert(make_pair(key, value));
  }
  return parsed;
}

string UrlUtils::decode(const string& s, bool plusAsSpace) {
  string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); i++) {
    char c = s[i];
    if (c == '%' && i + 2 < s.size()) {
      int hi = hexValue(s[i + 1]);
      int lo = hexValue(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(char((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    if (c == '+' && plusAsSpace) {
      out.push_back(' ');
      continue;
    }
    out.push_back(c);
  }
  return out;
}

string UrlUtils::encode(const string& s) {
  static const char hex[] = "0123456789ABCDEF";
  string out;
  for (unsigned char c : s) {
    if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(char(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0xF]);
    }
  }
  return out;
}

vector<string> UrlUtils::pathSegments(const string& path) {
  vector<string> segments;
  for (const auto& segment : split(path, '/')) {
    if (!segment.empty()) {
      segments.push_back(decode(segment));
    }
  }
  return segments;
}

string UrlUtils::stripPrefix(const string& path, const string& prefix) {
  if (path.compare(0, prefix.size(), prefix) != 0) {
    return path;
  }
  string rest = path.substr(prefix.size());
  if (rest.empty()) {
    return "/";
  }
  if (rest[0] != '/') {
    // "/api/v10" is not under "/api/v1"
    return path;
  }
  return rest;
}

int UrlUtils::queryInt(const map<string, string>& query, const string& key,
                       int defaultValue) {
  auto it = query.find(key);
  if (it == query.end()) {
    return defaultValue;
  }
  try {
    size_t used;
    int value = stoi(it->second, &used);
    if (used != it->second.size()) {
      return defaultValue;
    }
    return value;
  } catch (const std::logic_error&) {
    return defaultValue;
  }
}
}  // namespace wt
