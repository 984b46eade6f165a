#include "log_level.h"

#include <algorithm>
#include <cctype>

#include <glog/logging.h>

namespace Vigil {

bool ApplyLogLevel(const std::string& level) {
	std::string upper = level;
	std::transform(upper.begin(), upper.end(), upper.begin(),
			[](unsigned char c) { return static_cast<char>(std::toupper(c)); });

	FLAGS_v = 0;
	FLAGS_minloglevel = google::GLOG_INFO;
	if (upper == "TRACE") {
		FLAGS_v = 5;
	} else if (upper == "DEBUG") {
		FLAGS_v = 2;
	} else if (upper == "INFO") {
		// defaults
	} else if (upper == "WARNING" || upper == "WARN") {
		FLAGS_minloglevel = google::GLOG_WARNING;
	} else if (upper == "ERROR") {
		FLAGS_minloglevel = google::GLOG_ERROR;
	} else {
		LOG(WARNING) << "Unknown log level '" << level << "', using INFO";
		return false;
	}
	return true;
}

} // namespace Vigil
