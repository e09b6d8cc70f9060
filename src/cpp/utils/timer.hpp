#pragma once
// Steady-clock timers for operation budgets and retry/backoff bookkeeping
#include <chrono>
#include <cstdint>
#include <string>

#include "logger.hpp"

namespace harvest {

class Timer {
public:
    Timer() noexcept { start(); }

    void start() noexcept { start_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] int64_t elapsed_us() const noexcept {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_).count();
    }

    [[nodiscard]] int64_t elapsed_ms() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
    }

    [[nodiscard]] double elapsed_sec() const noexcept {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_{};
};

// RAII soft budget -- logs a warning on destruction if the scope ran longer
// than budget_ms. Never changes the outcome of the guarded call.
class BudgetGuard {
public:
    BudgetGuard(std::string operation, int64_t budget_ms) noexcept
        : operation_(std::move(operation)), budget_ms_(budget_ms) {}

    ~BudgetGuard() {
        int64_t took = timer_.elapsed_ms();
        if (budget_ms_ > 0 && took > budget_ms_) {
            LOG_WRN("[budget] %s took %lld ms (budget %lld ms)",
                operation_.c_str(), static_cast<long long>(took),
                static_cast<long long>(budget_ms_));
        }
    }

    [[nodiscard]] int64_t elapsed_ms() const noexcept { return timer_.elapsed_ms(); }

    BudgetGuard(const BudgetGuard&) = delete;
    BudgetGuard& operator=(const BudgetGuard&) = delete;

private:
    std::string operation_;
    int64_t budget_ms_;
    Timer timer_;
};

} // namespace harvest
