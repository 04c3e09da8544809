#include "interrupt.hpp"
#include "logger.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

namespace wlgen {
    namespace {
        volatile std::sig_atomic_t caught_signal = 0;

        auto record_signal(int signum) -> void {
            caught_signal = signum;
        }

        auto install(int signum, struct sigaction *previous) -> void {
            struct sigaction action;
            std::memset(&action, 0, sizeof action);
            action.sa_handler = record_signal;
            sigemptyset(&action.sa_mask);

            if(sigaction(signum, &action, previous) != 0) {
                auto err = std::error_code { errno, std::system_category() };
                throw std::system_error(err, "sigaction");
            }
        }
    }

    interrupt_handler::interrupt_handler() {
        caught_signal = 0;

        install(SIGINT, &previous_int_);

        try {
            install(SIGTERM, &previous_term_);
        } catch(...) {
            sigaction(SIGINT, &previous_int_, nullptr);
            throw;
        }

        logger->trace("interrupt handler installed");
    }

    interrupt_handler::~interrupt_handler() {
        sigaction(SIGTERM, &previous_term_, nullptr);
        sigaction(SIGINT, &previous_int_, nullptr);

        logger->trace("interrupt handler removed");
    }

    auto interrupt_handler::requested() const noexcept -> bool {
        return caught_signal != 0;
    }

    auto interrupt_handler::signal_number() const noexcept -> int {
        return caught_signal;
    }
}
