#pragma once

#include "common.pb.h"
#include "common/status.hpp"

#include <cstdint>
#include <string>

namespace dispatch {
namespace core {

enum class DispatchErrorCode {
    kOk = 0,
    kAuthenticationFailed = 1,
    kClaimConflict = 2,
    kNoEligibleDriver = 3,
    kTransientStorage = 4,
    kDegradedCache = 5,
    kMalformedEvent = 6,
    kPermissionDenied = 7,
    kRequestNotFound = 8,
    kInvalidLocation = 9,
};

inline const char* DispatchErrorName(DispatchErrorCode error) {
    switch (error) {
        case DispatchErrorCode::kOk:
            return "OK";
        case DispatchErrorCode::kAuthenticationFailed:
            return "AUTHENTICATION_FAILED";
        case DispatchErrorCode::kClaimConflict:
            return "CLAIM_CONFLICT";
        case DispatchErrorCode::kNoEligibleDriver:
            return "NO_ELIGIBLE_DRIVER";
        case DispatchErrorCode::kTransientStorage:
            return "TRANSIENT_STORAGE";
        case DispatchErrorCode::kDegradedCache:
            return "DEGRADED_CACHE";
        case DispatchErrorCode::kMalformedEvent:
            return "MALFORMED_EVENT";
        case DispatchErrorCode::kPermissionDenied:
            return "PERMISSION_DENIED";
        case DispatchErrorCode::kRequestNotFound:
            return "REQUEST_NOT_FOUND";
        case DispatchErrorCode::kInvalidLocation:
            return "INVALID_LOCATION";
    }
    return "UNKNOWN";
}

// 将 DispatchErrorCode 转换为通用 Status
inline ::dispatch::common::Status FromDispatchError(DispatchErrorCode error, std::string message = "") {
    using ::dispatch::common::Status;
    switch (error) {
        case DispatchErrorCode::kOk:
            return Status::OK();
        case DispatchErrorCode::kAuthenticationFailed:
            return Status::Unauthenticated(message.empty() ? "Authentication failed" : message);
        case DispatchErrorCode::kClaimConflict:
            return Status::Aborted(message.empty() ? "Request already claimed" : message);
        case DispatchErrorCode::kNoEligibleDriver:
            return Status::NotFound(message.empty() ? "No eligible driver" : message);
        case DispatchErrorCode::kTransientStorage:
            return Status::Unavailable(message.empty() ? "Storage temporarily unavailable" : message);
        case DispatchErrorCode::kDegradedCache:
            return Status::Unavailable(message.empty() ? "Shared cache unavailable" : message);
        case DispatchErrorCode::kMalformedEvent:
            return Status::InvalidArgument(message.empty() ? "Malformed event" : message);
        case DispatchErrorCode::kPermissionDenied:
            return Status::PermissionDenied(message.empty() ? "Permission denied" : message);
        case DispatchErrorCode::kRequestNotFound:
            return Status::NotFound(message.empty() ? "Delivery request not found" : message);
        case DispatchErrorCode::kInvalidLocation:
            return Status::InvalidArgument(message.empty() ? "Invalid location" : message);
    }
    return Status::Internal("Unknown dispatch error");
}

// 把下层返回的 Status 归类到派单错误码, 用于下行错误事件
inline DispatchErrorCode ToDispatchError(const ::dispatch::common::Status& status) {
    using ::dispatch::common::StatusCode;
    switch (status.Code()) {
        case StatusCode::kOk:
            return DispatchErrorCode::kOk;
        case StatusCode::kInvalidArgument:
            return DispatchErrorCode::kMalformedEvent;
        case StatusCode::kNotFound:
            return DispatchErrorCode::kRequestNotFound;
        case StatusCode::kPermissionDenied:
            return DispatchErrorCode::kPermissionDenied;
        case StatusCode::kUnauthenticated:
            return DispatchErrorCode::kAuthenticationFailed;
        case StatusCode::kAborted:
        case StatusCode::kAlreadyExists:
            return DispatchErrorCode::kClaimConflict;
        case StatusCode::kInternal:
        case StatusCode::kUnavailable:
            return DispatchErrorCode::kTransientStorage;
    }
    return DispatchErrorCode::kTransientStorage;
}

// 将错误信息填充到 protobuf Error 消息中
inline void ErrorToProto(DispatchErrorCode error, const ::dispatch::common::Status& status
                        , ::proto::common::Error* error_proto) {
    if (!error_proto) {
        return;
    }
    error_proto->set_code(static_cast<int32_t>(error));
    error_proto->set_message(status.Message());
}

}
}
