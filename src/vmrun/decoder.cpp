#include <vmrun/decoder.h>

#include <cerrno>
#include <climits>
#include <cstdlib>

#include <spdlog/spdlog.h>
#include <vmrun/errors.h>
#include <vmrun/paths.h>
#include "utils.h"

namespace {

constexpr char kWhites[] = " \t\n\v\f";

} // namespace

std::string StripCarriageReturns(std::string_view str) {
  std::string ret;
  ret.reserve(str.size());
  for (char c : str) {
    if (c != '\r') ret.push_back(c);
  }
  return ret;
}

std::optional<int> ParseStatus(std::string_view str) {
  size_t first = str.find_first_not_of(kWhites);
  if (first == std::string_view::npos) return std::nullopt;
  str = str.substr(first, str.find_last_not_of(kWhites) - first + 1);
  size_t pos = str[0] == '-' || str[0] == '+' ? 1 : 0;
  if (pos == str.size()) return std::nullopt;
  for (size_t i = pos; i < str.size(); i++) {
    if (str[i] < '0' || str[i] > '9') return std::nullopt;
  }
  std::string digits(str);
  errno = 0;
  long val = strtol(digits.c_str(), nullptr, 10);
  if (errno == ERANGE || val < INT_MIN || val > INT_MAX) return std::nullopt;
  return (int)val;
}

RunOutcome DecodeStatus(std::string_view raw_status) {
  std::string status = StripCarriageReturns(raw_status);
  auto code = ParseStatus(status);
  if (!code) {
    if (status.empty()) {
      spdlog::warn("Status channel is empty; the guest halted without reporting");
    } else {
      spdlog::warn("Status channel is unparseable: \"{}\"", status);
    }
    return {OutcomeKind::PROTOCOL_ERROR, kProtocolErrorCode};
  }
  if (*code != 0) return {OutcomeKind::FAILURE, *code};
  return {OutcomeKind::SUCCESS, 0};
}

RunOutcome DecodeResult(const fs::path& output_sink, const fs::path& status_sink,
                        const fs::path& final_output) {
  std::string raw_status;
  if (!ReadFile(status_sink, raw_status)) {
    // unreadable is no better than empty
    raw_status.clear();
  }
  RunOutcome outcome = DecodeStatus(raw_status);
  spdlog::info("Guest outcome: {} code={}", OutcomeKindName(outcome.kind), outcome.exit_code);
  if (outcome.kind != OutcomeKind::SUCCESS) {
    spdlog::debug("Not promoting {}", output_sink.c_str());
    return outcome;
  }

  std::string raw_output;
  if (!ReadFile(output_sink, raw_output)) {
    throw VmrunError("cannot read output sink " + output_sink.string());
  }
  std::string output = StripCarriageReturns(raw_output);
  fs::path tmp = PromoteTempPath(final_output);
  if (!WriteFile(tmp, output) || !Move(tmp, final_output)) {
    IGNORE_RETURN(RemoveFile(tmp));
    throw VmrunError("cannot write final output " + final_output.string());
  }
  spdlog::info("Promoted {} bytes to {}", output.size(), final_output.c_str());
  return outcome;
}
