#pragma once

#include <chrono>
#include <cstdint>

namespace quota {
namespace common {

// 时间源接口, 所有会话时间戳均为 Unix 毫秒
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::int64_t NowMillis() const = 0;
};

class SystemClock : public Clock {
public:
    std::int64_t NowMillis() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

}
}
