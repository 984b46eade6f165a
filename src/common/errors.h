#ifndef VIGIL_COMMON_ERRORS_H_
#define VIGIL_COMMON_ERRORS_H_

#include <stdexcept>
#include <string>

namespace Vigil {

/**
 * Raised while turning configuration into runtime objects. Anything that
 * throws this must not be started.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace Vigil

#endif // VIGIL_COMMON_ERRORS_H_
