#ifndef INCLUDE_VMRUN_UTILS_H_
#define INCLUDE_VMRUN_UTILS_H_

#include <string>
#include <optional>

#include "process.h"
#include "launcher.h"
#include "decoder.h"

// logging
const char* OutcomeKindName(OutcomeKind);
const char* ChannelModeName(ChannelMode);
const char* KvmModeName(KvmMode);
std::optional<KvmMode> GetKvmMode(const std::string&);

#endif  // INCLUDE_VMRUN_UTILS_H_
