// Repository: Jukebox-controller
// Component: JSON line helpers
// Purpose: Minimal flat-object JSON encode/decode for JSONL state files and mpv IPC.
// Copyright (c) 2026 Jukebox

#include "jukebox/util/JsonLine.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace jukebox::util {

namespace {

// Position just after `"key":` (whitespace skipped), or npos.
size_t FindValueStart(const std::string& line, const std::string& key) {
  const std::string search = "\"" + key + "\"";
  size_t pos = 0;
  while ((pos = line.find(search, pos)) != std::string::npos) {
    size_t i = pos + search.size();
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    if (i < line.size() && line[i] == ':') {
      ++i;
      while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
      return i;
    }
    pos += search.size();
  }
  return std::string::npos;
}

}  // namespace

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
      out += buf;
    } else {
      out += c;
    }
  }
  return out;
}

JsonLineWriter& JsonLineWriter::Add(const std::string& key, const std::string& value) {
  members_.emplace_back(key, "\"" + JsonEscape(value) + "\"");
  return *this;
}

JsonLineWriter& JsonLineWriter::Add(const std::string& key, const char* value) {
  return Add(key, std::string(value));
}

JsonLineWriter& JsonLineWriter::Add(const std::string& key, int64_t value) {
  members_.emplace_back(key, std::to_string(value));
  return *this;
}

std::string JsonLineWriter::Build() const {
  std::ostringstream o;
  o << '{';
  bool first = true;
  for (const auto& [key, value] : members_) {
    if (!first) o << ',';
    first = false;
    o << '"' << JsonEscape(key) << "\":" << value;
  }
  o << '}';
  return o.str();
}

std::optional<std::string> JsonStringField(const std::string& line, const std::string& key) {
  size_t i = FindValueStart(line, key);
  if (i == std::string::npos || i >= line.size() || line[i] != '"') return std::nullopt;
  std::string out;
  for (++i; i < line.size(); ++i) {
    char c = line[i];
    if (c == '"') return out;
    if (c == '\\' && i + 1 < line.size()) {
      char e = line[++i];
      switch (e) {
        case '"': out += '"'; break;
        case '\\': out += '\\'; break;
        case '/': out += '/'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'u': {
          if (i + 4 >= line.size()) return std::nullopt;
          unsigned code = static_cast<unsigned>(std::strtoul(line.substr(i + 1, 4).c_str(), nullptr, 16));
          i += 4;
          // UTF-8 encode the BMP code point; surrogate pairs are kept as-is.
          if (code < 0x80) {
            out += static_cast<char>(code);
          } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
          } else {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
          }
          break;
        }
        default: out += e; break;
      }
      continue;
    }
    out += c;
  }
  return std::nullopt;  // unterminated
}

std::optional<int64_t> JsonIntField(const std::string& line, const std::string& key) {
  size_t i = FindValueStart(line, key);
  if (i == std::string::npos || i >= line.size()) return std::nullopt;
  const char* begin = line.c_str() + i;
  char* end = nullptr;
  long long v = std::strtoll(begin, &end, 10);
  if (end == begin) return std::nullopt;
  if (*end == '.' || *end == 'e' || *end == 'E') return std::nullopt;
  return static_cast<int64_t>(v);
}

std::optional<double> JsonNumberField(const std::string& line, const std::string& key) {
  size_t i = FindValueStart(line, key);
  if (i == std::string::npos || i >= line.size()) return std::nullopt;
  const char* begin = line.c_str() + i;
  char* end = nullptr;
  double v = std::strtod(begin, &end);
  if (end == begin) return std::nullopt;
  return v;
}

}  // namespace jukebox::util
