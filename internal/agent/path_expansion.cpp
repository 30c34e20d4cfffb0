#include "internal/agent/path_expansion.hpp"

#include <cctype>
#include <cstdlib>

namespace fetchgate::agent {

namespace {

bool IsVarChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string ExpandHome(const std::string& path) {
  if (path.empty() || path[0] != '~') {
    return path;
  }
  if (path.size() > 1 && path[1] != '/') {
    // ~user is not supported
    return path;
  }
  const char* home = std::getenv("HOME");
  if (home == nullptr) {
    return path;
  }
  return std::string(home) + path.substr(1);
}

} // namespace

std::string ExpandPath(const std::string& path) {
  const auto  input = ExpandHome(path);
  std::string out;
  out.reserve(input.size());

  std::size_t i = 0;
  while (i < input.size()) {
    if (input[i] != '$') {
      out.push_back(input[i++]);
      continue;
    }

    std::size_t name_begin = i + 1;
    std::size_t name_end   = name_begin;
    std::size_t next       = name_begin;
    if (name_begin < input.size() && input[name_begin] == '{') {
      auto close = input.find('}', name_begin + 1);
      if (close == std::string::npos) {
        out.push_back(input[i++]);
        continue;
      }
      name_begin = name_begin + 1;
      name_end   = close;
      next       = close + 1;
    } else {
      while (name_end < input.size() && IsVarChar(input[name_end])) ++name_end;
      next = name_end;
    }

    const auto  name  = input.substr(name_begin, name_end - name_begin);
    const char* value = name.empty() ? nullptr : std::getenv(name.c_str());
    if (value != nullptr) {
      out += value;
    } else {
      out.append(input, i, next - i);
    }
    i = next;
  }
  return out;
}

} // namespace fetchgate::agent
