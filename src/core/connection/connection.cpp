#include "core/connection/connection.hpp"

#include <algorithm>
#include <cctype>

namespace dispatch {
namespace core {

std::string RoleToString(Role role) {
    switch (role) {
        case Role::kConsumer:
            return "consumer";
        case Role::kDriver:
            return "driver";
        case Role::kMerchant:
            return "merchant";
        case Role::kAdmin:
            return "admin";
        case Role::kUnknown:
            break;
    }
    return "unknown";
}

dispatch::common::StatusOr<Role> RoleFromString(const std::string& value) {
    std::string normalized = value;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (normalized == "consumer") {
        return dispatch::common::StatusOr<Role>(Role::kConsumer);
    }
    if (normalized == "driver") {
        return dispatch::common::StatusOr<Role>(Role::kDriver);
    }
    if (normalized == "merchant") {
        return dispatch::common::StatusOr<Role>(Role::kMerchant);
    }
    if (normalized == "admin") {
        return dispatch::common::StatusOr<Role>(Role::kAdmin);
    }
    return dispatch::common::Status::InvalidArgument("Unknown role: " + value);
}

proto::common::Role RoleToProto(Role role) {
    switch (role) {
        case Role::kConsumer:
            return proto::common::ROLE_CONSUMER;
        case Role::kDriver:
            return proto::common::ROLE_DRIVER;
        case Role::kMerchant:
            return proto::common::ROLE_MERCHANT;
        case Role::kAdmin:
            return proto::common::ROLE_ADMIN;
        case Role::kUnknown:
            break;
    }
    return proto::common::ROLE_UNKNOWN;
}

}
}
