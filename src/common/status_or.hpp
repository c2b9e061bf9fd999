#pragma once

#include "common/status.hpp"

#include <optional>
#include <type_traits>
#include <utility>

namespace dispatch {
namespace common {

// 返回一个包含状态或值的对象
template <typename T>
class StatusOr {
public:
    StatusOr(const Status& status) : status_(status) {}
    StatusOr(Status&& status) : status_(std::move(status)) {}

    template <class U = T, std::enable_if_t<std::is_constructible_v<T, U&&>, int> = 0>
    explicit StatusOr(U&& value)
        : status_(Status::OK()), value_(std::forward<U>(value)) {}

    bool IsOk() const {
        return status_.IsOk() && value_.has_value();
    }
    const Status& GetStatus() const {
        return status_;
    }

    // 访问存储的值, 调用前必须先检查 IsOk()
    T& Value() & {
        return *value_;
    }
    T&& Value() && {
        return std::move(*value_);
    }
    const T& Value() const& {
        return *value_;
    }
    const T&& Value() const&& = delete;
private:
    Status status_;
    std::optional<T> value_;
};

}
}
