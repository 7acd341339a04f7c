#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/device/access_policy.hpp"
#include "core/device/quota_ledger.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace quota {
namespace core {

// 设备列表中的一项, 指纹只展示前缀
struct DeviceView {
    std::string  session_id;
    std::string  fingerprint_prefix;
    std::string  device_type;
    std::string  browser;
    std::string  os;
    std::string  ip_address;
    std::int64_t last_active_at_ms = 0;
    std::int64_t expires_at_ms = 0;
    bool         is_current = false;
};

// 管理接口: 先鉴权, 再调用账本; 不直接接触存储
class DeviceAdmin {
public:
    using Status = quota::common::Status;

    explicit DeviceAdmin(std::shared_ptr<QuotaLedger> ledger);

    // 结束一个会话. 会话不存在或已失效时返回 false, 不视为错误
    quota::common::StatusOr<bool> Logout(const Caller& caller, const std::string& session_id);

    quota::common::StatusOr<int> ResetGroup(const Caller& caller, const std::string& group_id);

    quota::common::StatusOr<std::vector<DeviceView>> ListActive(const Caller& caller,
                                                                const std::string& group_id,
                                                                const std::string& current_session_id);

    quota::common::StatusOr<QuotaGroup> UpdateLimit(const Caller& caller,
                                                    const std::string& group_id,
                                                    int new_limit);

    quota::common::StatusOr<GroupUsage> GetUsage(const Caller& caller, const std::string& group_id);

private:
    std::shared_ptr<QuotaLedger> ledger_;
};

} // namespace core
} // namespace quota
