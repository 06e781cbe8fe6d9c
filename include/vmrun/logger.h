#ifndef INCLUDE_VMRUN_LOGGER_H_
#define INCLUDE_VMRUN_LOGGER_H_

// Replace the default logger with a colored stderr one; stdout is the guest console.
void InitLogger();
// 0 = warn, 1 = info, 2+ = debug
void SetVerbosity(int verbosity);

#endif  // INCLUDE_VMRUN_LOGGER_H_
