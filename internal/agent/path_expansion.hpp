#pragma once

#include <string>

namespace fetchgate::agent {

/*
  Expands a leading "~" or "~/" to $HOME and every $VAR or ${VAR} to its
  environment value. Unknown variables are left as written.
*/
std::string ExpandPath(const std::string& path);

} // namespace fetchgate::agent
