// examples/example_binary.cpp — Binary floating-point values, host doubles and radix conversion.

#include <iostream>

#include <rmath/rmathlib.hpp>

int
main() {
    using rmath::context;
    using rmath::status;
    using rmath::io::operator<<;

    const rmath::bigfloat_math binary;
    const auto tenth = rmath::from_double(0.1);
    std::cout << "0.1 as a double is exactly " << rmath::decimal_from_double(0.1) << "\n";
    std::cout << "binary form: " << tenth << "\n";

    status st;
    const auto sum = binary.add(tenth, rmath::from_double(0.2), context::binary64(), st);
    std::cout << "0.1 + 0.2 in binary64 = " << rmath::to_double(sum) << " ("
              << rmath::convert_radix<10>(sum, context{}.with_precision(20), st) << ")\n";

    const auto root = binary.square_root(rmath::from_double(2.0), context::binary32(), st);
    std::cout << "sqrt(2) in binary32 = " << rmath::to_double(root) << " [" << st.value() << "]\n";
    return 0;
}
