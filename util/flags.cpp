#include "util/flags.hpp"

DEFINE_string(sandbox_root, "sandbox",
              "Directory every execution is confined to. If unset, "
              "$SANDBOX_ROOT is used");
DEFINE_string(interpreter, "python3",
              "Interpreter used to run the code, looked up in PATH");
DEFINE_string(interpreter_args, "",
              "Comma-separated arguments passed to the interpreter before the "
              "script");
DEFINE_string(script_suffix, ".py", "Suffix of the staged code file");
DEFINE_string(child_env, "PYTHONUTF8=1",
              "Comma-separated KEY=VALUE pairs added to the environment of the "
              "executed code. PATH is always forwarded");
DEFINE_double(default_timeout_s, 5,
              "Time budget of requests that do not specify one");
DEFINE_double(max_timeout_s, 60,
              "Largest time budget a request may ask for. If unset, "
              "$SANDBOX_MAX_TIMEOUT_S is used");
DEFINE_uint64(max_output_bytes, 1 << 20,
              "Bytes kept for each of stdout and stderr. If unset, "
              "$SANDBOX_MAX_OUTPUT_BYTES is used");
DEFINE_int32(max_concurrent, 0,
             "Number of executions that may run at the same time, further "
             "requests wait. If unset, $SANDBOX_MAX_CONCURRENT is used, 0 "
             "means the number of cores");
DEFINE_int64(memory_limit_kb, 0, "Address space limit, 0 means unlimited");
DEFINE_int64(max_file_size_kb, 0,
             "Largest file the code may write, 0 means unlimited");
DEFINE_int32(max_files, 0, "Open files limit, 0 means unlimited");
