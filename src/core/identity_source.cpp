#include "objid/core/identity_source.hpp"

#include <cerrno>
#include <cstring>

#include <limits.h>
#include <unistd.h>

#ifndef HOST_NAME_MAX
#define HOST_NAME_MAX 255
#endif

namespace objid::core {

Result<std::string> SystemIdentitySource::hostname() const {
  char buffer[HOST_NAME_MAX + 1] = {};
  if (::gethostname(buffer, sizeof(buffer) - 1) != 0) {
    return makeErrorResult<std::string>(ErrorCode::kSystemError,
                                        std::string("gethostname failed: ") + std::strerror(errno));
  }
  return std::string(buffer);
}

std::uint32_t SystemIdentitySource::processId() const {
  return static_cast<std::uint32_t>(::getpid());
}

}  // namespace objid::core
