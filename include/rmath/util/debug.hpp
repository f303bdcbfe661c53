// include/rmath/util/debug.hpp — Structural dumps of numbers, parts and contexts.

#pragma once

#include <ostream>

#include <rmath/context.hpp>
#include <rmath/core/number.hpp>
#include <rmath/io/format.hpp>
#include <rmath/io/options.hpp>

namespace rmath::util {

inline const char* kind_name(core::number_kind kind) noexcept {
    switch (kind) {
        case core::number_kind::finite:
            return "finite";
        case core::number_kind::infinity:
            return "infinity";
        case core::number_kind::quiet_nan:
            return "nan";
        case core::number_kind::signaling_nan:
            return "snan";
    }
    return "unknown";
}

inline std::ostream& dump(std::ostream& os, const core::bigint& value) {
    return os << "bigint(" << rmath::io::to_string(value) << ')';
}

inline std::ostream& dump(std::ostream& os, const core::number_parts& parts) {
    return os << "parts(" << kind_name(parts.kind) << ", " << (parts.negative ? '-' : '+') << ", "
              << rmath::io::to_string(parts.mantissa) << ", " << rmath::io::to_string(parts.exponent)
              << ')';
}

template <int Radix>
std::ostream& dump(std::ostream& os, const core::basic_number<Radix>& value) {
    os << "number<" << Radix << ">(";
    dump(os, value.parts());
    return os << ')';
}

inline std::ostream& dump(std::ostream& os, const context& ctx) {
    return os << "context(" << rmath::io::to_string(ctx) << ')';
}

inline std::ostream& dump(std::ostream& os, const status& st) {
    return os << "status(" << rmath::to_string(st.value()) << ')';
}

} // namespace rmath::util
