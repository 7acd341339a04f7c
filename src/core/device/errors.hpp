#pragma once

#include "common.pb.h"
#include "common/status.hpp"

#include <string>

namespace quota {
namespace core {

// 业务错误码, 写入 proto::common::Error.code
enum class DeviceErrorCode {
    kOk = 0,
    kGroupNotFound = 1,
    kGroupDisabled = 2,
    kInvalidRequest = 3,
    kPermissionDenied = 4,
    kStorageUnavailable = 5,
    kTimeout = 6,
    kInternal = 7,
};

// 将通用 Status 归类为业务错误码
inline DeviceErrorCode ToDeviceError(const ::quota::common::Status& status) {
    using ::quota::common::StatusCode;
    switch (status.Code()) {
        case StatusCode::kOk:
            return DeviceErrorCode::kOk;
        case StatusCode::kNotFound:
            return DeviceErrorCode::kGroupNotFound;
        case StatusCode::kFailedPrecondition:
            return DeviceErrorCode::kGroupDisabled;
        case StatusCode::kInvalidArgument:
            return DeviceErrorCode::kInvalidRequest;
        case StatusCode::kPermissionDenied:
        case StatusCode::kUnauthenticated:
            return DeviceErrorCode::kPermissionDenied;
        case StatusCode::kUnavailable:
        case StatusCode::kResourceExhausted:
            return DeviceErrorCode::kStorageUnavailable;
        case StatusCode::kDeadlineExceeded:
            return DeviceErrorCode::kTimeout;
        default:
            return DeviceErrorCode::kInternal;
    }
}

// 将错误信息填充到 protobuf Error 消息中
inline void ErrorToProto(const ::quota::common::Status& status, ::proto::common::Error* error_proto) {
    if (!error_proto) {
        return;
    }
    error_proto->set_code(static_cast<int32_t>(ToDeviceError(status)));
    error_proto->set_message(status.Message());
}

} // namespace core
} // namespace quota
