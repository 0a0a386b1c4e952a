#pragma once

#include <string>
#include <utility>

namespace idlease {

class Status {
public:
    static Status OK() { return Status(); }
    static Status Error(int code, const std::string& msg) {
        return Status(code, msg);
    }

    // 分配器对外的三种错误，code 和 msg 固定，客户端依赖这些值
    static Status NoIdAvailable() {
        return Status(kNoIdAvailable, "No id available!");
    }
    static Status IdExpired() {
        return Status(kIdExpired, "Id expired!");
    }
    static Status IdNonexistent() {
        return Status(kIdNonexistent, "Id nonexistent!");
    }

    static Status InvalidArgument(const std::string& msg) {
        return Status(kInvalidArgument, msg);
    }
    static Status Internal(const std::string& msg) {
        return Status(kInternal, msg);
    }

    static constexpr int kOk = 0;
    static constexpr int kNoIdAvailable = 1;
    static constexpr int kIdExpired = 2;
    static constexpr int kIdNonexistent = 3;
    static constexpr int kInvalidArgument = -22;
    static constexpr int kInternal = -1;

    bool ok() const { return code_ == kOk; }
    int code() const { return code_; }
    const std::string& message() const { return msg_; }

    bool operator==(const Status& other) const {
        return code_ == other.code_ && msg_ == other.msg_;
    }

    bool operator!=(const Status& other) const {
        return !(*this == other);
    }

private:
    int code_ {kOk};
    std::string msg_;

    Status() = default;
    Status(int c, std::string m) : code_(c), msg_(std::move(m)) {}
};

} // namespace idlease
