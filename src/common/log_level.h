#pragma once

#include <string>

namespace Vigil {

/**
 * Maps TRACE, DEBUG, INFO, WARNING or ERROR (case-insensitive) onto glog.
 * TRACE and DEBUG raise verbosity (FLAGS_v 5 and 2); the others set
 * FLAGS_minloglevel. Unknown names fall back to INFO.
 * @return false if the name was not recognised
 */
bool ApplyLogLevel(const std::string& level);

} // namespace Vigil
