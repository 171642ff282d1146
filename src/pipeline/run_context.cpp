#include "pipeline/run_context.hpp"

#include <utility>

namespace trendloop::pipeline {

namespace {

bool IsValidKey(std::string_view key) {
  if (key.empty()) {
    return false;
  }
  for (const char c : key) {
    if (c == '=' || c == '\n' || c == '\r') {
      return false;
    }
  }
  return true;
}

std::string EscapeValue(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (const char c : raw) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    default:
      out.push_back(c);
      break;
    }
  }
  return out;
}

} // namespace

RunContext::RunContext(std::string run_id) : run_id_(std::move(run_id)) {}

const std::string& RunContext::RunId() const {
  return run_id_;
}

void RunContext::SetActiveWriter(std::string writer) {
  active_writer_ = std::move(writer);
}

const std::string& RunContext::ActiveWriter() const {
  return active_writer_;
}

bool RunContext::Put(std::string_view key, std::string value, std::string& error) {
  if (!IsValidKey(key)) {
    error = "context key must be non-empty and must not contain '=' or line breaks";
    return false;
  }

  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    entries_.emplace(std::string(key), Entry{std::move(value), active_writer_});
    return true;
  }

  if (it->second.writer != active_writer_) {
    error = "context key '" + std::string(key) + "' is owned by '" + it->second.writer +
            "' and cannot be rewritten by '" + active_writer_ + "'";
    return false;
  }

  it->second.value = std::move(value);
  return true;
}

std::optional<std::string> RunContext::Get(std::string_view key) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.value;
}

bool RunContext::Contains(std::string_view key) const {
  return entries_.find(key) != entries_.end();
}

std::string RunContext::OwnerOf(std::string_view key) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return "";
  }
  return it->second.writer;
}

std::map<std::string, std::string> RunContext::Values() const {
  std::map<std::string, std::string> values;
  for (const auto& [key, entry] : entries_) {
    values.emplace(key, entry.value);
  }
  return values;
}

std::size_t RunContext::Size() const {
  return entries_.size();
}

std::string ToKeyValueText(const RunContext& context) {
  std::string out;
  for (const auto& [key, value] : context.Values()) {
    out += key;
    out += '=';
    out += EscapeValue(value);
    out += '\n';
  }
  return out;
}

} // namespace trendloop::pipeline
