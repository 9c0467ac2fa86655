#include "updraft/runtime/shutdown_signals.h"

#include <cstring>
#include <pthread.h>
#include <string>

namespace updraft {

ShutdownSignalWaiter::ShutdownSignalWaiter(const SupervisorContext& context)
    : logger_(context.logger_for("signals"))
    , cancellation_(context.cancellation_handle()) {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);

    // 대기 스레드는 이 마스크를 물려받는다
    pthread_sigmask(SIG_BLOCK, &signals_, &previous_mask_);
    thread_ = std::thread(&ShutdownSignalWaiter::wait_loop, this);
}

ShutdownSignalWaiter::~ShutdownSignalWaiter() {
    stopping_ = true;
    // 이미 시그널을 받아 끝난 스레드라면 막힌 채 버려진다
    pthread_kill(thread_.native_handle(), SIGTERM);
    thread_.join();
    pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
}

std::optional<int> ShutdownSignalWaiter::received() const {
    const int sig = received_.load();
    return sig == 0 ? std::nullopt : std::optional<int>(sig);
}

void ShutdownSignalWaiter::wait_loop() {
    int sig = 0;
    const int rc = sigwait(&signals_, &sig);
    if (stopping_) {
        return;
    }
    if (rc != 0) {
        logger_.error(std::string("sigwait failed: ") + std::strerror(rc));
        return;
    }

    received_ = sig;
    logger_.info(std::string("Received ") + ::strsignal(sig) + ", shutting down");
    cancellation_->cancel();
}

} // namespace updraft
