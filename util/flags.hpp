#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

DECLARE_string(sandbox_root);
DECLARE_string(interpreter);
DECLARE_string(interpreter_args);
DECLARE_string(script_suffix);
DECLARE_string(child_env);
DECLARE_double(default_timeout_s);
DECLARE_double(max_timeout_s);
DECLARE_uint64(max_output_bytes);
DECLARE_int32(max_concurrent);
DECLARE_int64(memory_limit_kb);
DECLARE_int64(max_file_size_kb);
DECLARE_int32(max_files);

#endif
