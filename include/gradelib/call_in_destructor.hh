#pragma once

#include <utility>

// Calls the function on scope exit unless cancelled
template <class Func>
class CallInDtor {
    Func func_;
    bool make_call_ = true;

public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    CallInDtor(Func func) try : func_(std::move(func)) {
    } catch (...) {
        func();
        throw;
    }

    CallInDtor(const CallInDtor&) = delete;
    CallInDtor& operator=(const CallInDtor&) = delete;
    CallInDtor(CallInDtor&&) = delete;
    CallInDtor& operator=(CallInDtor&&) = delete;

    void cancel() noexcept { make_call_ = false; }

    ~CallInDtor() {
        if (make_call_) {
            func_();
        }
    }
};
