#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace fetchgate::storage::common {

// Rejects anything that could escape the directory it is joined into.
inline void ValidatePathComponent(const std::string& component, const char* what) {
  if (component.empty()) {
    throw std::invalid_argument(std::string(what) + " must not be empty");
  }
  for (char c : component) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument(std::string(what) + " contains invalid character");
    }
  }
  if (component == "." || component == "..") {
    throw std::invalid_argument(std::string(what) + " must not be a relative path component");
  }
}

/*
  Last path segment of a source path as the agent reported it. Both separator
  styles are honoured because agents may run on any platform.
*/
inline std::string SourceBaseName(const std::string& source_path) {
  auto        pos  = source_path.find_last_of("/\\");
  std::string base = pos == std::string::npos ? source_path : source_path.substr(pos + 1);

  for (auto& c : base) {
    if (c == '\0' || c == ':') {
      c = '_';
    }
  }
  if (base.empty() || base == "." || base == "..") {
    return "artifact";
  }
  return base;
}

// <root>/<agent_id>_<transfer_id>_<basename>
inline std::filesystem::path ArtifactPath(const std::filesystem::path& root, const std::string& agent_id, const std::string& transfer_id,
                                          const std::string& source_path) {
  ValidatePathComponent(agent_id, "agent id");
  ValidatePathComponent(transfer_id, "transfer id");
  return root / (agent_id + "_" + transfer_id + "_" + SourceBaseName(source_path));
}

// Bytes are staged here until the transfer completes.
inline std::filesystem::path StagingPath(const std::filesystem::path& artifact_path) {
  return std::filesystem::path(artifact_path.string() + ".part");
}

} // namespace fetchgate::storage::common
