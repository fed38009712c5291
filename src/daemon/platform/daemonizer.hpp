#pragma once

namespace platform {

// Detaches from the controlling terminal. Only the final child returns.
void daemonize();

} // namespace platform
