#pragma once

#include <string>
#include <utility>

namespace corolla {

enum class ResultStatus {
    OK,
    INSUFFICIENT_DATA,  // warm-up, not an error
    FAULT               // unexpected computation failure
};

// Value-or-reason return used where a caller needs to tell
// "no data yet" apart from "something went wrong".
template <typename T>
struct Result {
    ResultStatus status = ResultStatus::INSUFFICIENT_DATA;
    T value{};
    std::string message;

    bool isOk() const { return status == ResultStatus::OK; }
    bool isInsufficientData() const { return status == ResultStatus::INSUFFICIENT_DATA; }
    bool isFault() const { return status == ResultStatus::FAULT; }

    static Result ok(T v) {
        Result r;
        r.status = ResultStatus::OK;
        r.value = std::move(v);
        return r;
    }

    static Result insufficientData(std::string reason) {
        Result r;
        r.status = ResultStatus::INSUFFICIENT_DATA;
        r.message = std::move(reason);
        return r;
    }

    static Result fault(std::string reason) {
        Result r;
        r.status = ResultStatus::FAULT;
        r.message = std::move(reason);
        return r;
    }
};

} // namespace corolla
