#pragma once

#include <csignal>

namespace wlgen {
    /**
     * Catches SIGINT and SIGTERM for as long as the object lives and restores the previous
     * handlers afterwards. The signal handler only raises a flag; callers poll requested()
     * at points where stopping is safe.
     *
     * Only one instance may be alive at a time.
     */
    class interrupt_handler {
    public:
        interrupt_handler();
        ~interrupt_handler();

        interrupt_handler(interrupt_handler const &) = delete;
        interrupt_handler(interrupt_handler &&) = delete;
        interrupt_handler &operator=(interrupt_handler const &) = delete;
        interrupt_handler &operator=(interrupt_handler &&) = delete;

        [[nodiscard]] auto requested() const noexcept -> bool;

        /**
         * Number of the last caught signal, 0 if none.
         */
        [[nodiscard]] auto signal_number() const noexcept -> int;

    private:
        struct sigaction previous_int_;
        struct sigaction previous_term_;
    };
}
