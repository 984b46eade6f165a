#pragma once

#include <cstdlib>
#include <cstring>
#include <cstdint>
#include <string>

namespace Vigil {

inline bool IsEnvFalseValue(const char* value) {
	if (!value || !value[0]) return false;
	return std::strcmp(value, "0") == 0 ||
	       std::strcmp(value, "false") == 0 ||
	       std::strcmp(value, "FALSE") == 0 ||
	       std::strcmp(value, "no") == 0 ||
	       std::strcmp(value, "NO") == 0 ||
	       std::strcmp(value, "off") == 0;
}

inline bool IsEnvTrueValue(const char* value) {
	if (!value || !value[0]) return false;
	return std::strcmp(value, "1") == 0 ||
	       std::strcmp(value, "true") == 0 ||
	       std::strcmp(value, "TRUE") == 0 ||
	       std::strcmp(value, "yes") == 0 ||
	       std::strcmp(value, "YES") == 0 ||
	       std::strcmp(value, "on") == 0;
}

/**
 * Loads KEY=VALUE lines from a dotenv file into the process environment.
 * Variables already present in the real environment are left untouched.
 * Accepts blank lines, '#' comments, an optional "export " prefix and
 * single- or double-quoted values.
 * @return number of variables set; 0 when the file does not exist
 */
int LoadEnvFile(const std::string& path = ".env");

/**
 * Parses one dotenv line. Returns false for blank, comment or malformed lines.
 */
bool ParseEnvLine(const std::string& raw, std::string& key, std::string& value);

}  // namespace Vigil
