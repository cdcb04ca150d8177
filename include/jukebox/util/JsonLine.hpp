// Repository: Jukebox-controller
// Component: JSON line helpers
// Purpose: Minimal flat-object JSON encode/decode for JSONL state files and mpv IPC.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_UTIL_JSON_LINE_HPP_
#define JUKEBOX_UTIL_JSON_LINE_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jukebox::util {

std::string JsonEscape(const std::string& s);

// Builds one single-line JSON object from string and integer members,
// in insertion order.
class JsonLineWriter {
 public:
  JsonLineWriter& Add(const std::string& key, const std::string& value);
  JsonLineWriter& Add(const std::string& key, const char* value);
  JsonLineWriter& Add(const std::string& key, int64_t value);
  std::string Build() const;

 private:
  std::vector<std::pair<std::string, std::string>> members_;  // value already encoded
};

// Field lookups on a single-line flat JSON object. They return std::nullopt
// when the key is absent or the value has a different type; a corrupt line
// yields std::nullopt rather than throwing.
std::optional<std::string> JsonStringField(const std::string& line, const std::string& key);
std::optional<int64_t> JsonIntField(const std::string& line, const std::string& key);
std::optional<double> JsonNumberField(const std::string& line, const std::string& key);

}  // namespace jukebox::util

#endif  // JUKEBOX_UTIL_JSON_LINE_HPP_
