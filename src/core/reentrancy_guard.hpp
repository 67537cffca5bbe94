/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: reentrancy_guard.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Non-reentrant flag for one contract instance. A Section marks the
 * instance as in-flight for its lifetime; opening a second Section before
 * the first closes throws ReentrantCall, which fails the nested call only.
 * ============================================================================
 */

#ifndef SPL_REENTRANCY_GUARD_HPP
#define SPL_REENTRANCY_GUARD_HPP

#include <string>

#include "errors.hpp"

namespace spl {

    class ReentrancyGuard {
    public:
        class Section {
        public:
            Section(ReentrancyGuard& guard, const std::string& operation) : guard_(guard) {
                if (guard_.entered_) {
                    throw ReentrantCall("Reentrant call rejected: " + operation);
                }
                guard_.entered_ = true;
            }

            ~Section() { guard_.entered_ = false; }

            Section(const Section&) = delete;
            Section& operator=(const Section&) = delete;

        private:
            ReentrancyGuard& guard_;
        };

    private:
        bool entered_ = false;
    };

} // namespace spl

#endif // SPL_REENTRANCY_GUARD_HPP
