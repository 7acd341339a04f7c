#pragma once

#include "common/status.hpp"
#include "core/device/device_session.hpp"

#include <string>

namespace quota {
namespace core {

// 已通过认证的调用方, 由上游网关解析后传入
struct Caller {
    std::string user_id;
    std::string role;      // super_admin / admin / school_admin / 其他成员角色
    std::string school_id;
    std::string group_id;  // 调用方自身登录所在的分组
    std::string session_id; // 调用方当前设备的会话, 没有则为空
};

// 能否管理该分组 (强制下线、重置、修改限额)
bool IsGroupAdmin(const Caller& caller, const QuotaGroup& group);
// 是否为该分组的成员
bool IsGroupMember(const Caller& caller, const std::string& group_id);
// 成员只能结束自己设备的会话
bool OwnsSession(const Caller& caller, const DeviceSession& session);

quota::common::Status AuthorizeGroupAdmin(const Caller& caller, const QuotaGroup& group);
// 管理员或分组成员
quota::common::Status AuthorizeGroupViewer(const Caller& caller, const QuotaGroup& group);

} // namespace core
} // namespace quota
