// examples/example_decimal.cpp — Walks through contexts, flags and traps with the decimal facade.

#include <iostream>

#include <rmath/rmathlib.hpp>

int
main() {
    using rmath::context;
    using rmath::status;
    using rmath::io::operator<<;

    const rmath::decimal_math math;
    const auto one = rmath::io::decimal_from_string("1");
    const auto three = rmath::io::decimal_from_string("3");

    std::cout << "1 + 3 = " << math.add(one, three) << "\n";

    const context five = rmath::io::parse_context("precision=5;rounding=half_even");
    status st;
    const auto third = math.divide(one, three, five, st);
    std::cout << "1 / 3 at " << rmath::io::to_string(five) << " = " << third << " [" << st.value()
              << "]\n";

    status fast;
    const auto fast_third = math.divide(one, three, five.with_simplified(true), fast);
    std::cout << "simplified engine agrees: " << std::boolalpha << (fast_third == third) << "\n";

    status pi_status;
    std::cout << "pi to 30 digits = " << math.pi(context{}.with_precision(30), pi_status) << "\n";

    status trapped;
    try {
        (void)math.divide(one, rmath::decimal::zero(), context::basic(), trapped);
    } catch (const rmath::trap_error& error) {
        std::cout << "basic context trapped: " << error.what() << " [" << trapped.value() << "]\n";
    }
    return 0;
}
