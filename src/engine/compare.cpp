// src/engine/compare.cpp — Ordering, context-aware comparison and the min/max family.

#include <rmath/engine/full_arithmetic.hpp>

namespace rmath::engine {

namespace {

    int sign_of(const number_parts &value, bool by_magnitude) {
        if (value.is_finite() && value.mantissa.is_zero()) {
            return 0;
        }
        return (value.negative && !by_magnitude) ? -1 : 1;
    }

    int to_int(std::strong_ordering order) {
        if (order < 0) {
            return -1;
        }
        return order > 0 ? 1 : 0;
    }

} // namespace

int full_arithmetic::compare_finite(const number_parts &a, const number_parts &b,
                                    bool by_magnitude) const {
    const int sign_a = sign_of(a, by_magnitude);
    const int sign_b = sign_of(b, by_magnitude);
    if (sign_a != sign_b) {
        return sign_a < sign_b ? -1 : 1;
    }
    if (sign_a == 0) {
        return 0;
    }
    int magnitude = 0;
    if (a.is_infinity() || b.is_infinity()) {
        magnitude = static_cast<int>(a.is_infinity()) - static_cast<int>(b.is_infinity());
    } else {
        const bigint adjusted_a = detail::adjusted_exponent(a, radix_);
        const bigint adjusted_b = detail::adjusted_exponent(b, radix_);
        if (adjusted_a != adjusted_b) {
            magnitude = adjusted_a < adjusted_b ? -1 : 1;
        } else {
            const bigint &low = a.exponent < b.exponent ? a.exponent : b.exponent;
            const bigint lhs = core::detail::scale_up(a.mantissa, radix_,
                                                      core::detail::to_size(a.exponent - low));
            const bigint rhs = core::detail::scale_up(b.mantissa, radix_,
                                                      core::detail::to_size(b.exponent - low));
            magnitude = to_int(lhs <=> rhs);
        }
    }
    return sign_a * magnitude;
}

int full_arithmetic::compare(const number_parts &a, const number_parts &b) const {
    if (a.is_nan() || b.is_nan()) {
        return static_cast<int>(a.is_nan()) - static_cast<int>(b.is_nan());
    }
    return compare_finite(a, b, false);
}

number_parts full_arithmetic::compare_to_with_context(const number_parts &a, const number_parts &b,
                                                      bool treat_quiet_nan_as_signaling,
                                                      const context &ctx, flags &raised) const {
    if (treat_quiet_nan_as_signaling && (a.is_nan() || b.is_nan())) {
        raised |= flags::invalid;
    }
    if (auto nan = propagate_nan(a, b, ctx, raised)) {
        return *nan;
    }
    const int order = compare_finite(a, b, false);
    return detail::make_finite(order < 0, bigint(order < 0 ? -order : order), {});
}

number_parts full_arithmetic::min_max(const number_parts &a, const number_parts &b,
                                      const context &ctx, bool want_max, bool by_magnitude,
                                      flags &raised) const {
    if (a.is_signaling() || b.is_signaling()) {
        return *propagate_nan(a, b, ctx, raised);
    }
    // A single quiet NaN loses to any number.
    if (a.is_nan() != b.is_nan()) {
        return finalize(a.is_nan() ? b : a, ctx, raised);
    }
    if (a.is_nan()) {
        return *propagate_nan(a, b, ctx, raised);
    }
    int order = compare_finite(a, b, by_magnitude);
    if (order == 0) {
        if (a.negative != b.negative) {
            order = a.negative ? -1 : 1;
        } else if (a.negative) {
            order = a.exponent < b.exponent ? 1 : -1;
        } else {
            order = a.exponent > b.exponent ? 1 : -1;
        }
    }
    if (!want_max) {
        order = -order;
    }
    return finalize(order > 0 ? a : b, ctx, raised);
}

number_parts full_arithmetic::min(const number_parts &a, const number_parts &b,
                                  const context &ctx, flags &raised) const {
    return min_max(a, b, ctx, false, false, raised);
}

number_parts full_arithmetic::max(const number_parts &a, const number_parts &b,
                                  const context &ctx, flags &raised) const {
    return min_max(a, b, ctx, true, false, raised);
}

number_parts full_arithmetic::min_magnitude(const number_parts &a, const number_parts &b,
                                            const context &ctx, flags &raised) const {
    return min_max(a, b, ctx, false, true, raised);
}

number_parts full_arithmetic::max_magnitude(const number_parts &a, const number_parts &b,
                                            const context &ctx, flags &raised) const {
    return min_max(a, b, ctx, true, true, raised);
}

} // namespace rmath::engine
