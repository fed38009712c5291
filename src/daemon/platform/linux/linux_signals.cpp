#include "platform/shutdown_signals.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/signalfd.h>

namespace platform {

int open_shutdown_signalfd() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (sigprocmask(SIG_BLOCK, &mask, nullptr) != 0) {
        std::println(stderr, "sigprocmask failed: {}", std::strerror(errno));
        return -1;
    }

    int fd = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (fd < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
    }
    return fd;
}

} // namespace platform
