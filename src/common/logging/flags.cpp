#include <gflags/gflags.h>

DEFINE_string(log_level, "info", "trace, debug, info, warn, error, critical or off");
DEFINE_string(log_file, "im_orchestrator.log", "Rotating log file; empty logs to stderr only");
DEFINE_int32(log_max_size, 10 * 1024 * 1024, "Bytes written before the log file rotates");
DEFINE_int32(log_max_files, 3, "Rotated log files kept on disk");
DEFINE_bool(log_to_stderr, false, "Mirror log lines to stderr");
