#pragma once

#include <ostream>
#include <string>
#include <system_error>
#include <type_traits>

namespace streamavg {

// Outcomes reported by Accumulator::add_with_result.
enum class Error {
    // A negative value reached a kind declared unsigned. Nothing is committed.
    NegativeValueToUnsignedType = 1,
    // Reserved for bounded accumulator variants; never produced.
    Overflow,
    Underflow,
    CountOverflow,
    // The mean reached the configured threshold. The value IS committed.
    ThresholdReached,
};

[[nodiscard]] inline const char* to_string(Error e) noexcept {
    switch (e) {
        case Error::NegativeValueToUnsignedType: return "NegativeValueToUnsignedType";
        case Error::Overflow:                    return "Overflow";
        case Error::Underflow:                   return "Underflow";
        case Error::CountOverflow:               return "CountOverflow";
        case Error::ThresholdReached:            return "ThresholdReached";
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, Error e) {
    return os << to_string(e);
}

namespace detail {

class ErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "streamavg"; }

    std::string message(int ev) const override {
        switch (static_cast<Error>(ev)) {
            case Error::NegativeValueToUnsignedType:
                return "negative value added to an unsigned numeric kind";
            case Error::Overflow:
                return "arithmetic overflow";
            case Error::Underflow:
                return "arithmetic underflow";
            case Error::CountOverflow:
                return "observation count overflow";
            case Error::ThresholdReached:
                return "mean reached the configured threshold";
        }
        return "unknown streamavg error";
    }
};

}  // namespace detail

[[nodiscard]] inline const std::error_category& error_category() noexcept {
    static const detail::ErrorCategory category{};
    return category;
}

[[nodiscard]] inline std::error_code make_error_code(Error e) noexcept {
    return {static_cast<int>(e), error_category()};
}

}  // namespace streamavg

namespace std {
template <>
struct is_error_code_enum<streamavg::Error> : true_type {};
}  // namespace std
