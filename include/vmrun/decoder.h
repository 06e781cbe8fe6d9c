#ifndef INCLUDE_VMRUN_DECODER_H_
#define INCLUDE_VMRUN_DECODER_H_

#include <string>
#include <optional>
#include <string_view>
#include <filesystem>

namespace fs = std::filesystem;

constexpr int kProtocolErrorCode = 99;

#define ENUM_OUTCOME_KIND_ \
  X(SUCCESS) /* status 0, output promoted */ \
  X(FAILURE) /* nonzero guest status, output discarded */ \
  X(PROTOCOL_ERROR) /* status channel empty or unparseable */
enum class OutcomeKind {
#define X(name) name,
  ENUM_OUTCOME_KIND_
#undef X
};

struct RunOutcome {
  OutcomeKind kind;
  int exit_code;
};

// the serial transport turns every LF into CRLF
std::string StripCarriageReturns(std::string_view);
// Accepts one decimal integer, optionally signed and surrounded by whitespace.
// Input must already be CR-stripped.
std::optional<int> ParseStatus(std::string_view);

RunOutcome DecodeStatus(std::string_view raw_status);
// Reads both sinks after the hypervisor exited. The final output is written
//   only on SUCCESS. Throws VmrunError if the promotion itself fails.
RunOutcome DecodeResult(const fs::path& output_sink, const fs::path& status_sink,
                        const fs::path& final_output);

#endif  // INCLUDE_VMRUN_DECODER_H_
