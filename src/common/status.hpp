#pragma once

#include <string>
#include <utility>

namespace session_cache {
namespace common {

// 定义状态码枚举, gRPC
enum class StatusCode {
    kOk = 0,
    kInvalidArgument = 3,
    kFailedPrecondition = 9,
    kInternal = 13,
    kUnavailable = 14,
    kDataLoss = 15,
};

// 表示操作结果的状态
class Status {
public:
    Status() = default;
    Status(StatusCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    static Status OK() {
        return Status(StatusCode::kOk, "");
    }
    static Status InvalidArgument(std::string message) {
        return Status(StatusCode::kInvalidArgument, std::move(message));
    }
    static Status FailedPrecondition(std::string message) {
        return Status(StatusCode::kFailedPrecondition, std::move(message));
    }
    static Status Internal(std::string message) {
        return Status(StatusCode::kInternal, std::move(message));
    }
    static Status Unavailable(std::string message) {
        return Status(StatusCode::kUnavailable, std::move(message));
    }
    static Status DataLoss(std::string message) {
        return Status(StatusCode::kDataLoss, std::move(message));
    }

    bool IsOk() const {
        return code_ == StatusCode::kOk;
    }
    StatusCode Code() const {
        return code_;
    }
    const std::string& Message() const {
        return message_;
    }
private:
    StatusCode code_ = StatusCode::kOk;
    std::string message_;
};

inline std::string StatusCodeToString(StatusCode code) {
    switch (code) {
        case StatusCode::kOk:
            return "OK";
        case StatusCode::kInvalidArgument:
            return "Invalid Argument";
        case StatusCode::kFailedPrecondition:
            return "Failed Precondition";
        case StatusCode::kInternal:
            return "Internal";
        case StatusCode::kUnavailable:
            return "Unavailable";
        case StatusCode::kDataLoss:
            return "Data Loss";
        default:
            return "Unknown";
    }
}

}
}
