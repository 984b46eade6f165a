#include "env_flags.h"

#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>

#include <glog/logging.h>

namespace Vigil {

namespace {

std::string Trim(const std::string& s) {
	size_t begin = 0;
	size_t end = s.size();
	while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
	while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
	return s.substr(begin, end - begin);
}

bool StartsWithIgnoreCase(const std::string& s, const char* prefix) {
	size_t n = std::strlen(prefix);
	if (s.size() < n) return false;
	for (size_t i = 0; i < n; ++i) {
		if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
	}
	return true;
}

} // namespace

bool ParseEnvLine(const std::string& raw, std::string& key, std::string& value) {
	std::string line = Trim(raw);
	if (line.empty() || line[0] == '#') {
		return false;
	}
	if (StartsWithIgnoreCase(line, "export ")) {
		line = Trim(line.substr(7));
	}
	size_t eq = line.find('=');
	if (eq == std::string::npos) {
		return false;
	}
	key = Trim(line.substr(0, eq));
	value = Trim(line.substr(eq + 1));
	if (value.size() >= 2) {
		char q = value.front();
		if ((q == '"' || q == '\'') && value.back() == q) {
			value = value.substr(1, value.size() - 2);
		}
	}
	return !key.empty();
}

int LoadEnvFile(const std::string& path) {
	std::error_code ec;
	if (!std::filesystem::exists(path, ec)) {
		return 0;
	}
	std::ifstream in(path);
	if (!in.is_open()) {
		LOG(WARNING) << "Failed to load " << path << ": " << strerror(errno);
		return 0;
	}

	int loaded = 0;
	std::string raw, key, value;
	while (std::getline(in, raw)) {
		if (!ParseEnvLine(raw, key, value)) {
			continue;
		}
		// overwrite=0: the real environment wins
		if (std::getenv(key.c_str()) == nullptr) {
			if (setenv(key.c_str(), value.c_str(), 0) == 0) {
				++loaded;
			} else {
				LOG(WARNING) << "setenv(" << key << ") failed: " << strerror(errno);
			}
		}
	}
	VLOG(1) << "Loaded " << loaded << " variables from " << path;
	return loaded;
}

}  // namespace Vigil
