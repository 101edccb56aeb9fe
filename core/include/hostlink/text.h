#pragma once
#include <string>
#include <vector>

namespace hostlink::text {

// Remove formatting markers from a reply line:
//  - section-sign color/style codes ("\xC2\xA7" + one char, e.g. "§6")
//  - ANSI escape sequences (CSI "ESC [ ... final", and bare ESC + char)
//  - remaining C0 control characters except TAB
std::string strip_formatting(const std::string& s);

std::string trim(const std::string& s);

// Split on runs of spaces/tabs; never yields empty tokens.
std::vector<std::string> split_ws(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

bool starts_with(const std::string& s, const std::string& prefix);
bool contains(const std::string& haystack, const std::string& needle);

// Keep [A-Za-z0-9_], map everything else to '_', collapse repeats, trim '_'.
std::string sanitize_identifier(const std::string& s);

} // namespace hostlink::text
