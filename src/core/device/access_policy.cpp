#include "core/device/access_policy.hpp"

namespace quota {
namespace core {

using quota::common::Status;

namespace {

constexpr const char* kRoleSuperAdmin = "super_admin";
constexpr const char* kRoleAdmin = "admin";
constexpr const char* kRoleSchoolAdmin = "school_admin";

} // namespace

bool IsGroupAdmin(const Caller& caller, const QuotaGroup& group) {
    if (caller.role == kRoleSuperAdmin || caller.role == kRoleAdmin) {
        return true;
    }
    if (caller.role == kRoleSchoolAdmin) {
        return !caller.school_id.empty() && caller.school_id == group.school_id;
    }
    return false;
}

bool IsGroupMember(const Caller& caller, const std::string& group_id) {
    return !caller.group_id.empty() && caller.group_id == group_id;
}

bool OwnsSession(const Caller& caller, const DeviceSession& session) {
    return IsGroupMember(caller, session.group_id) && !caller.session_id.empty() &&
           caller.session_id == session.session_id;
}

Status AuthorizeGroupAdmin(const Caller& caller, const QuotaGroup& group) {
    if (!IsGroupAdmin(caller, group)) {
        return Status::PermissionDenied("Caller cannot manage this group.");
    }
    return Status::OK();
}

Status AuthorizeGroupViewer(const Caller& caller, const QuotaGroup& group) {
    if (!IsGroupAdmin(caller, group) && !IsGroupMember(caller, group.group_id)) {
        return Status::PermissionDenied("Caller cannot access this group.");
    }
    return Status::OK();
}

} // namespace core
} // namespace quota
