#include <curlmux/core/SignalHandler.hpp>

#include <csignal>
#include <iostream>

using curlmux::core::SignalHandler;

namespace {

/// SIGTERM 은 프로세스를 끝내지 않고 플래그로만 기록됩니다.
bool test_signal_sets_flag() {
    SignalHandler handler;
    handler.reset();

    if (std::raise(SIGTERM) != 0) {
        std::cerr << "[flag] raise failed\n";
        return false;
    }

    if (!handler.isStopRequested()) {
        std::cerr << "[flag] stop flag not set\n";
        return false;
    }

    int signo = 0;
    if (!handler.consumeStopRequest(&signo) || signo != SIGTERM) {
        std::cerr << "[flag] consume returned signo=" << signo << "\n";
        return false;
    }

    // 한 번 소비한 요청은 다시 보이지 않는다
    if (handler.consumeStopRequest() || handler.isStopRequested()) {
        std::cerr << "[flag] request observed twice\n";
        return false;
    }
    return true;
}

bool test_reset_clears_pending_request() {
    SignalHandler handler;

    (void)std::raise(SIGINT);
    handler.reset();

    if (handler.isStopRequested()) {
        std::cerr << "[reset] flag survived reset\n";
        return false;
    }
    return true;
}

bool test_signal_names() {
    if (SignalHandler::signalName(SIGINT) != "SIGINT" ||
        SignalHandler::signalName(SIGTERM) != "SIGTERM" ||
        SignalHandler::signalName(0) != "UNKNOWN") {
        std::cerr << "[names] unexpected signal name\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_signal_sets_flag();
    ok = ok && test_reset_clears_pending_request();
    ok = ok && test_signal_names();

    if (!ok) {
        std::cerr << "SignalHandler tests FAILED\n";
        return 1;
    }

    std::cout << "SignalHandler tests PASSED\n";
    return 0;
}
