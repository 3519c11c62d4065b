#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <ostream>
#include <system_error>
#include <type_traits>
#include <unordered_map>

#include <streamavg/error.hpp>
#include <streamavg/numeric_kind.hpp>

namespace streamavg {

/**
 * @brief Outcome of a single Accumulator::add_with_result call.
 *
 * `mean` is the accumulator's mean after the call. On
 * `Error::ThresholdReached` it already includes the value; on
 * `Error::NegativeValueToUnsignedType` it is the unchanged previous mean.
 */
struct AddResult {
    double mean{0.0};
    std::error_code error{};

    [[nodiscard]] bool ok() const noexcept { return !error; }
    explicit operator bool() const noexcept { return ok(); }
};

/**
 * @brief Construction-time settings of an Accumulator.
 *
 * - `threshold`  : mean at/above which add_with_result reports
 *                  `Error::ThresholdReached`. Defaults to the largest finite
 *                  double, i.e. never in practice.
 * - `track_mode` : keep the per-value frequency table needed by `mode()`.
 */
struct AccumulatorOptions {
    double threshold{std::numeric_limits<double>::max()};
    bool track_mode{true};
};

namespace detail {

// Mode table key: the value's bit pattern, with -0.0 folded into +0.0 and
// every NaN folded into one quiet NaN.
[[nodiscard]] inline std::uint64_t mode_key(double x) noexcept {
    if (std::isnan(x)) {
        x = std::numeric_limits<double>::quiet_NaN();
    } else if (x == 0.0) {
        x = 0.0;
    }
    std::uint64_t bits;
    std::memcpy(&bits, &x, sizeof bits);
    return bits;
}

[[nodiscard]] inline double mode_value(std::uint64_t key) noexcept {
    double x;
    std::memcpy(&x, &key, sizeof x);
    return x;
}

template <typename U>
using enable_if_numeric_kind_t = std::enable_if_t<is_numeric_kind_v<U>, bool>;

}  // namespace detail

/**
 * @brief Incremental mean / mode / count over a stream of numeric values.
 *
 * Values of kind `T` are converted to `double` on arrival and folded into
 * a running mean with the recurrence
 *
 * \f[
 *   \mu_n = \mu_{n-1} + \frac{x_n - \mu_{n-1}}{n}
 * \f]
 *
 * so no running sum is kept and large integer inputs (e.g. repeated
 * `std::numeric_limits<std::uint64_t>::max()`) never overflow.
 *
 * ## Mode
 * With mode tracking on, every distinct value gets a frequency counter and
 * `mode()` is derived from that table on demand.
 *
 * ## Threshold
 * Once the mean reaches the configured threshold, `add_with_result` reports
 * `Error::ThresholdReached` for that and every later value while the mean
 * stays at/above it. The value is committed regardless.
 *
 * ## Ownership
 * Mutation goes through non-const members only. An instance shared between
 * threads must be guarded by the caller.
 *
 * @tparam T Numeric kind; needs a `numeric_kind<T>` specialization.
 */
template <typename T>
class Accumulator {
    static_assert(is_numeric_kind_v<T>,
                  "Accumulator requires a type with a numeric_kind specialization");

public:
    Accumulator() = default;

    explicit Accumulator(const AccumulatorOptions& options)
        : threshold_(options.threshold), track_mode_(options.track_mode) {}

    /**
     * @brief Accumulator with mode tracking on and the given threshold.
     *
     * The threshold is not validated: a value <= 0 makes the first
     * non-negative mean report `Error::ThresholdReached`.
     */
    [[nodiscard]] static Accumulator with_threshold(double threshold) {
        return Accumulator(AccumulatorOptions{threshold, true});
    }

    /**
     * @brief Fold one value into the aggregate and report the outcome.
     *
     * @param value Value to add.
     * @return The mean after the call, plus an error code when the value was
     *         rejected (`NegativeValueToUnsignedType`, nothing changed) or the
     *         threshold was reached (`ThresholdReached`, value committed).
     */
    [[nodiscard]] AddResult add_with_result(T value) {
        const double x = numeric_kind<T>::to_double(value);
        if (!numeric_kind<T>::is_signed && x < 0.0) {
            return AddResult{mean_, make_error_code(Error::NegativeValueToUnsignedType)};
        }

        if (track_mode_) ++modes_[detail::mode_key(x)];

        ++n_;
        mean_ += (x - mean_) / static_cast<double>(n_);

        if (mean_ >= threshold_) {
            return AddResult{mean_, make_error_code(Error::ThresholdReached)};
        }
        return AddResult{mean_, {}};
    }

    // Same as add_with_result, outcome discarded.
    void add(T value) { static_cast<void>(add_with_result(value)); }

    Accumulator& operator+=(T value) {
        add(value);
        return *this;
    }

    [[nodiscard]] std::size_t count() const noexcept { return n_; }
    [[nodiscard]] double mean() const noexcept { return mean_; }
    [[nodiscard]] double threshold() const noexcept { return threshold_; }
    [[nodiscard]] bool tracks_mode() const noexcept { return track_mode_; }

    /**
     * @brief Most frequent value seen so far.
     *
     * - no values yet: `0.0`
     * - mode tracking off, or no value seen twice: the current mean
     * - one value at the highest frequency: that value
     * - several values tied at the highest frequency: the one closest to the
     *   mean; at equal distance, the smallest of them
     */
    [[nodiscard]] double mode() const noexcept {
        if (n_ == 0) return 0.0;

        std::size_t max_freq = 0;
        for (const auto& [key, freq] : modes_) {
            if (freq > max_freq) max_freq = freq;
        }
        if (max_freq <= 1) return mean_;

        bool found = false;
        double best = 0.0;
        double best_dist = 0.0;
        for (const auto& [key, freq] : modes_) {
            if (freq != max_freq) continue;

            const double v = detail::mode_value(key);
            double dist = std::abs(v - mean_);
            if (std::isnan(dist)) dist = std::numeric_limits<double>::infinity();

            if (!found || dist < best_dist || (dist == best_dist && v < best)) {
                found = true;
                best = v;
                best_dist = dist;
            }
        }
        return best;
    }

private:
    std::size_t n_{0};
    double mean_{0.0};
    double threshold_{std::numeric_limits<double>::max()};
    bool track_mode_{true};
    std::unordered_map<std::uint64_t, std::size_t> modes_{};
};

// --- Accumulator vs. accumulator -------------------------------------------

template <typename T>
[[nodiscard]] bool operator==(const Accumulator<T>& a, const Accumulator<T>& b) noexcept {
    return a.mean() == b.mean();
}
template <typename T>
[[nodiscard]] bool operator!=(const Accumulator<T>& a, const Accumulator<T>& b) noexcept {
    return a.mean() != b.mean();
}
template <typename T>
[[nodiscard]] bool operator<(const Accumulator<T>& a, const Accumulator<T>& b) noexcept {
    return a.mean() < b.mean();
}
template <typename T>
[[nodiscard]] bool operator<=(const Accumulator<T>& a, const Accumulator<T>& b) noexcept {
    return a.mean() <= b.mean();
}
template <typename T>
[[nodiscard]] bool operator>(const Accumulator<T>& a, const Accumulator<T>& b) noexcept {
    return a.mean() > b.mean();
}
template <typename T>
[[nodiscard]] bool operator>=(const Accumulator<T>& a, const Accumulator<T>& b) noexcept {
    return a.mean() >= b.mean();
}

// --- Accumulator vs. raw value ---------------------------------------------
// Any kind with a numeric_kind specialization, on either side. The value is
// converted to double and compared with mean().

template <typename T, typename U, detail::enable_if_numeric_kind_t<U> = true>
[[nodiscard]] bool operator==(const Accumulator<T>& a, const U& v) {
    return a.mean() == numeric_kind<U>::to_double(v);
}
template <typename T, typename U, detail::enable_if_numeric_kind_t<U> = true>
[[nodiscard]] bool operator!=(const Accumulator<T>& a, const U& v) {
    return a.mean() != numeric_kind<U>::to_double(v);
}
template <typename T, typename U, detail::enable_if_numeric_kind_t<U> = true>
[[nodiscard]] bool operator<(const Accumulator<T>& a, const U& v) {
    return a.mean() < numeric_kind<U>::to_double(v);
}
template <typename T, typename U, detail::enable_if_numeric_kind_t<U> = true>
[[nodiscard]] bool operator<=(const Accumulator<T>& a, const U& v) {
    return a.mean() <= numeric_kind<U>::to_double(v);
}
template <typename T, typename U, detail::enable_if_numeric_kind_t<U> = true>
[[nodiscard]] bool operator>(const Accumulator<T>& a, const U& v) {
    return a.mean() > numeric_kind<U>::to_double(v);
}
template <typename T, typename U, detail::enable_if_numeric_kind_t<U> = true>
[[nodiscard]] bool operator>=(const Accumulator<T>& a, const U& v) {
    return a.mean() >= numeric_kind<U>::to_double(v);
}

template <typename T, typename U, detail::enable_if_numeric_kind_t<U> = true>
[[nodiscard]] bool operator==(const U& v, const Accumulator<T>& a) {
    return numeric_kind<U>::to_double(v) == a.mean();
}
template <typename T, typename U, detail::enable_if_numeric_kind_t<U> = true>
[[nodiscard]] bool operator!=(const U& v, const Accumulator<T>& a) {
    return numeric_kind<U>::to_double(v) != a.mean();
}
template <typename T, typename U, detail::enable_if_numeric_kind_t<U> = true>
[[nodiscard]] bool operator<(const U& v, const Accumulator<T>& a) {
    return numeric_kind<U>::to_double(v) < a.mean();
}
template <typename T, typename U, detail::enable_if_numeric_kind_t<U> = true>
[[nodiscard]] bool operator<=(const U& v, const Accumulator<T>& a) {
    return numeric_kind<U>::to_double(v) <= a.mean();
}
template <typename T, typename U, detail::enable_if_numeric_kind_t<U> = true>
[[nodiscard]] bool operator>(const U& v, const Accumulator<T>& a) {
    return numeric_kind<U>::to_double(v) > a.mean();
}
template <typename T, typename U, detail::enable_if_numeric_kind_t<U> = true>
[[nodiscard]] bool operator>=(const U& v, const Accumulator<T>& a) {
    return numeric_kind<U>::to_double(v) >= a.mean();
}

// Writes the current mean with the stream's default formatting.
template <typename T>
std::ostream& operator<<(std::ostream& os, const Accumulator<T>& a) {
    return os << a.mean();
}

}  // namespace streamavg
