#pragma once

#include <string>
#include <vector>

namespace adr {

// Tab-separated records with backslash escapes, shared by the extraction
// cache and pattern data files.
std::string Escape(const std::string &value);
std::string Unescape(const std::string &value);
std::vector<std::string> SplitEscaped(const std::string &line);
std::string JoinEscaped(const std::vector<std::string> &fields);

} // namespace adr
