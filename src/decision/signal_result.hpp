#ifndef FAKEPROBE_SIGNAL_RESULT_HPP
#define FAKEPROBE_SIGNAL_RESULT_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace fakeprobe {

// Output of one analysis stage: either a value or the reason it is missing.
template <typename T>
class SignalResult {
public:
    SignalResult() : value_(), available_(false), reason_("not run") {}

    static SignalResult ok(T value) {
        SignalResult result;
        result.value_ = std::move(value);
        result.available_ = true;
        result.reason_.clear();
        return result;
    }

    static SignalResult unavailable(const std::string& reason) {
        SignalResult result;
        result.reason_ = reason;
        return result;
    }

    bool available() const { return available_; }
    explicit operator bool() const { return available_; }

    const T& value() const {
        if (!available_) {
            throw std::logic_error("Signal unavailable: " + reason_);
        }
        return value_;
    }

    const T* get() const { return available_ ? &value_ : nullptr; }

    const std::string& reason() const { return reason_; }

private:
    T value_;
    bool available_;
    std::string reason_;
};

} // namespace fakeprobe

#endif // FAKEPROBE_SIGNAL_RESULT_HPP
