#pragma once

namespace platform {

// Blocks SIGINT and SIGTERM for the calling thread and returns a non-blocking
// signalfd that reports them, or -1. Threads started afterwards inherit the
// mask, so call this before any worker thread exists.
int open_shutdown_signalfd();

} // namespace platform
