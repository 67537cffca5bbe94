/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: money.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Exact signed amount of the indivisible base unit (wei-like). Backed by an
 * arbitrary-precision integer so nothing in the ledger path ever touches a
 * floating point value. Display strings are converted at the boundary only.
 * ============================================================================
 */

#ifndef SPL_MONEY_HPP
#define SPL_MONEY_HPP

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/operators.hpp>

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

namespace spl {

class Money
    : private boost::totally_ordered<Money>
    , private boost::additive<Money>
{
public:
    using value_type = boost::multiprecision::cpp_int;

    /**
     * @brief Result of splitting an amount equally with floor division.
     * share * participants + remainder == amount, 0 <= remainder < participants.
     */
    struct Split;

    Money() = default;
    Money(std::int64_t units) : units_(units) {}
    explicit Money(value_type units) : units_(std::move(units)) {}

    /**
     * @brief Parses a base-unit integer string ("150", "-42").
     * @throws InvalidAmount on anything that is not an optional '-' followed
     * by decimal digits.
     */
    static Money from_string(const std::string& text);

    /**
     * @brief Parses a display value ("0.15") into base units for a currency
     * with the given number of decimals. Excess fractional digits are
     * rejected rather than rounded.
     */
    static Money from_decimal(const std::string& text, unsigned decimals);

    const value_type& units() const { return units_; }

    bool is_zero() const { return units_.is_zero(); }
    bool is_positive() const { return units_.sign() > 0; }
    bool is_negative() const { return units_.sign() < 0; }

    Money magnitude() const;

    /**
     * @brief Equal split among `participants` parties using floor division.
     * Only defined for a positive amount and a positive participant count.
     */
    Split split(std::size_t participants) const;

    std::string to_string() const;

    /**
     * @brief Display form with a fixed number of decimals, e.g.
     * to_decimal(18) of 150000000000000000 is "0.15". Trailing zeros of the
     * fraction are trimmed, never rounded.
     */
    std::string to_decimal(unsigned decimals) const;

    Money operator-() const { return Money(value_type(-units_)); }

    Money& operator+=(const Money& other) {
        units_ += other.units_;
        return *this;
    }

    Money& operator-=(const Money& other) {
        units_ -= other.units_;
        return *this;
    }

    friend bool operator==(const Money& lhs, const Money& rhs) { return lhs.units_ == rhs.units_; }
    friend bool operator<(const Money& lhs, const Money& rhs) { return lhs.units_ < rhs.units_; }

private:
    value_type units_;
};

struct Money::Split {
    Money share;
    Money remainder;
};

inline Money min(const Money& a, const Money& b) {
    return b < a ? b : a;
}

std::ostream& operator<<(std::ostream& os, const Money& amount);

} // namespace spl

#endif // SPL_MONEY_HPP
