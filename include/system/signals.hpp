#pragma once

#include <atomic>

namespace updock {

// Set by the first SIGINT/SIGTERM; Checker::CheckAll reads it before starting
// each image and reports the images it skips as cancelled.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace updock
