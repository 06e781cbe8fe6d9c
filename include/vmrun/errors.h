#ifndef INCLUDE_VMRUN_ERRORS_H_
#define INCLUDE_VMRUN_ERRORS_H_

#include <stdexcept>
#include <string>

class VmrunError : public std::runtime_error {
 public:
  explicit VmrunError(const std::string& msg) : std::runtime_error(msg) {}
};

// detected before the hypervisor is started; nothing has been launched
class ConfigurationError : public VmrunError {
 public:
  explicit ConfigurationError(const std::string& msg) : VmrunError(msg) {}
};

// the hypervisor could not be started or died abnormally; nothing is decoded
class LaunchError : public VmrunError {
 public:
  explicit LaunchError(const std::string& msg) : VmrunError(msg) {}
};

#endif  // INCLUDE_VMRUN_ERRORS_H_
