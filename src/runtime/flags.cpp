#include <gflags/gflags.h>

DEFINE_int32(max_concurrent_tasks, 4, "Maximum number of tasks executing at once");
DEFINE_int32(dispatch_poll_ms, 100, "Dispatcher poll interval in milliseconds");
DEFINE_int32(admission_batch, 16, "Eligible runs considered per dispatch cycle");
DEFINE_int32(max_retries, 3, "Default retries after the first attempt of a task");
DEFINE_int32(retry_base_ms, 1000, "Base delay of the exponential retry backoff");
DEFINE_int32(retry_max_ms, 60000, "Upper bound of a single retry delay");
DEFINE_int32(task_timeout_ms, 300000, "Default per-task timeout in milliseconds");
DEFINE_string(store_path, "", "SQLite database path (empty keeps state in memory)");
