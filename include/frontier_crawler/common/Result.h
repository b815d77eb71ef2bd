#pragma once
#include <string>
#include <utility>

// Outcome of a store, parser or sink operation: either a value, or a message
// explaining why there is none. Failures never throw past the component boundary.
template <typename T>
struct Result {
    bool success = false;
    T value{};
    std::string message;

    static Result<T> Success(T value, const std::string& message = "") {
        return Result<T>(true, std::move(value), message);
    }

    static Result<T> Failure(const std::string& message) {
        return Result<T>(false, T{}, message);
    }

    Result(bool success, T value, const std::string& message)
        : success(success), value(std::move(value)), message(message)
    {
    }

    Result() = default;
};
