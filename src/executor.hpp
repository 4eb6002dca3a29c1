#pragma once

// Global work-stealing executor via Taskflow.
//
// Provides a process-global tf::Executor sized to
// std::thread::hardware_concurrency(). Multi-document batches submit
// their per-document work through it.
//
// Internal header, not installed.

#include <taskflow/taskflow.hpp>

namespace docpatch::detail {

// Process-global executor. Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace docpatch::detail
