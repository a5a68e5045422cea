#include "executor/result_assembler.hpp"

namespace {

const constexpr char kReplacement[] = "\xEF\xBF\xBD";

// Returns the number of bytes of the sequence starting with lead, and the
// range allowed for its second byte. Returns 0 for bytes that cannot start a
// sequence.
size_t SequenceLength(unsigned char lead, unsigned char* lo,
                      unsigned char* hi) {
  *lo = 0x80;
  *hi = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) return 2;
  if (lead >= 0xE0 && lead <= 0xEF) {
    if (lead == 0xE0) *lo = 0xA0;
    if (lead == 0xED) *hi = 0x9F;
    return 3;
  }
  if (lead >= 0xF0 && lead <= 0xF4) {
    if (lead == 0xF0) *lo = 0x90;
    if (lead == 0xF4) *hi = 0x8F;
    return 4;
  }
  return 0;
}

}  // namespace

namespace executor {

std::string SanitizeUtf8(const std::string& data, bool truncated) {
  std::string out;
  out.reserve(data.size());
  size_t i = 0;
  while (i < data.size()) {
    unsigned char lead = data[i];
    if (truncated && out.size() >= data.size()) break;
    if (lead < 0x80) {
      out += data[i++];
      continue;
    }
    unsigned char lo, hi;
    size_t len = SequenceLength(lead, &lo, &hi);
    // Each maximal invalid subpart becomes a single replacement character.
    size_t valid = len == 0 ? 0 : 1;
    while (valid > 0 && valid < len && i + valid < data.size()) {
      unsigned char c = data[i + valid];
      if (c < lo || c > hi) break;
      lo = 0x80;
      hi = 0xBF;
      valid++;
    }
    if (len != 0 && valid == len) {
      if (truncated && out.size() + len > data.size()) break;
      out.append(data, i, len);
      i += len;
    } else {
      if (truncated && i + valid == data.size()) break;
      if (truncated && out.size() + sizeof(kReplacement) - 1 > data.size()) {
        break;
      }
      out += kReplacement;
      i += valid == 0 ? 1 : valid;
    }
  }
  return out;
}

proto::ExecutionResult AssembleResult(const sandbox::ExecutionInfo& info) {
  proto::ExecutionResult result;
  result.set_stdout(SanitizeUtf8(info.stdout_data, info.stdout_truncated));
  result.set_stderr(SanitizeUtf8(info.stderr_data, info.stderr_truncated));
  result.set_timed_out(info.timed_out);
  if (!info.timed_out) {
    result.set_exit_code(info.signal ? -info.signal : info.status_code);
  }
  result.set_stdout_truncated(info.stdout_truncated);
  result.set_stderr_truncated(info.stderr_truncated);
  result.set_truncated(info.stdout_truncated || info.stderr_truncated);
  result.set_duration_ms(info.wall_time_millis);
  result.set_signal(info.signal);
  result.set_cpu_time_ms(info.cpu_time_millis);
  result.set_sys_time_ms(info.sys_time_millis);
  result.set_memory_kb(info.memory_usage_kb);
  return result;
}

}  // namespace executor
