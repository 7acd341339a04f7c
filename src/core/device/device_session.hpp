#pragma once

#include <cstdint>
#include <string>

namespace quota {
namespace core {

// 会话失效原因
enum class EndReason {
    kNone = 0,
    kLogout,      // 设备主动登出
    kExpired,     // 心跳超时
    kEvicted,     // 管理员强制下线
    kGroupReset,  // 分组批量重置
};

inline const char* EndReasonToString(EndReason reason) {
    switch (reason) {
        case EndReason::kNone:
            return "";
        case EndReason::kLogout:
            return "logout";
        case EndReason::kExpired:
            return "expired";
        case EndReason::kEvicted:
            return "evicted";
        case EndReason::kGroupReset:
            return "group_reset";
    }
    return "";
}

inline EndReason EndReasonFromString(const std::string& value) {
    if (value == "logout") return EndReason::kLogout;
    if (value == "expired") return EndReason::kExpired;
    if (value == "evicted") return EndReason::kEvicted;
    if (value == "group_reset") return EndReason::kGroupReset;
    return EndReason::kNone;
}

// 一台已准入设备对分组配额的占用
struct DeviceSession {
    std::string   session_id;
    std::string   group_id;
    std::string   fingerprint_hash;
    // 以下仅用于展示和审计, 不参与唯一性判断
    std::string   ip_address;
    std::string   user_agent;
    std::string   platform;
    std::string   device_type;
    std::string   browser;
    std::string   os;
    std::int64_t  created_at_ms = 0;
    std::int64_t  last_active_at_ms = 0;
    std::int64_t  expires_at_ms = 0;
    bool          is_active = false;
    std::int64_t  ended_at_ms = 0;
    EndReason     end_reason = EndReason::kNone;
    std::uint32_t heartbeat_count = 0;

    // 活跃且未过期才计入配额
    bool CountsAt(std::int64_t now_ms) const {
        return is_active && expires_at_ms > now_ms;
    }
};

// 配额作用域: 班级登录账号或 (学校, 角色)
struct QuotaGroup {
    std::string  group_id;
    std::string  school_id;
    std::string  kind;
    int          limit = 1;
    bool         enabled = true;
    std::int64_t updated_at_ms = 0;
};

} // namespace core
} // namespace quota
