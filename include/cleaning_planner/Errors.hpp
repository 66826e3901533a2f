#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

// 틱 도중 처리되지 않은 예외. 상태는 마지막으로 확정된 틱으로 되돌려진 뒤 던져진다.
class TickFault : public std::runtime_error {
public:
    TickFault(std::size_t tick, const std::string& cause, std::string context)
        : std::runtime_error("tick " + std::to_string(tick) + " 실패: " + cause),
          tick_(tick), context_(std::move(context)) {}

    std::size_t tick() const { return tick_; }
    const std::string& context() const { return context_; }

private:
    std::size_t tick_;
    std::string context_;
};

// 틱 상한을 넘도록 끝나지 않은 실행
class WatchdogExpired : public std::runtime_error {
public:
    explicit WatchdogExpired(std::size_t limit)
        : std::runtime_error("watchdog: " + std::to_string(limit) + " 틱 안에 수렴하지 않음"),
          limit_(limit) {}

    std::size_t limit() const { return limit_; }

private:
    std::size_t limit_;
};
