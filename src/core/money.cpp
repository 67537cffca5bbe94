/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: money.cpp
 * ============================================================================
 */

#include "money.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>

namespace spl {

namespace {

bool all_digits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

Money::value_type pow10(unsigned exponent) {
    Money::value_type result = 1;
    for (unsigned i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

} // namespace

Money Money::from_string(const std::string& text) {
    bool negative = !text.empty() && text[0] == '-';
    std::string digits = negative ? text.substr(1) : text;

    if (!all_digits(digits)) {
        throw InvalidAmount("Amount is not a base-unit integer: '" + text + "'");
    }

    value_type units(digits);
    return Money(negative ? value_type(-units) : units);
}

Money Money::from_decimal(const std::string& text, unsigned decimals) {
    bool negative = !text.empty() && text[0] == '-';
    std::string body = negative ? text.substr(1) : text;

    std::string whole = body;
    std::string fraction;
    std::size_t dot = body.find('.');
    if (dot != std::string::npos) {
        whole = body.substr(0, dot);
        fraction = body.substr(dot + 1);
        if (fraction.empty()) {
            throw InvalidAmount("Amount has an empty fraction: '" + text + "'");
        }
    }

    if (!all_digits(whole) || (!fraction.empty() && !all_digits(fraction))) {
        throw InvalidAmount("Amount is not a decimal number: '" + text + "'");
    }

    // Trailing zeros carry no value; anything else past the unit is rejected.
    while (fraction.size() > decimals && fraction.back() == '0') {
        fraction.pop_back();
    }
    if (fraction.size() > decimals) {
        throw InvalidAmount("Amount '" + text + "' is finer than the base unit (" + std::to_string(decimals) + " decimals)");
    }
    fraction.append(decimals - fraction.size(), '0');

    value_type units = value_type(whole) * pow10(decimals);
    if (!fraction.empty()) {
        units += value_type(fraction);
    }
    return Money(negative ? value_type(-units) : units);
}

Money Money::magnitude() const {
    return is_negative() ? -*this : *this;
}

Money::Split Money::split(std::size_t participants) const {
    if (participants == 0) {
        throw InvalidRecord("Cannot split an amount among zero participants");
    }
    if (!is_positive()) {
        throw InvalidAmount("Only a positive amount can be split, got " + to_string());
    }

    // Both operands are positive here, so truncation is floor division.
    value_type count = static_cast<unsigned long long>(participants);
    value_type share = units_ / count;
    value_type remainder = units_ % count;
    return Split{Money(share), Money(remainder)};
}

std::string Money::to_string() const {
    return units_.str();
}

std::string Money::to_decimal(unsigned decimals) const {
    std::string digits = magnitude().units_.str();
    if (digits.size() <= decimals) {
        digits.insert(0, decimals - digits.size() + 1, '0');
    }

    std::string whole = digits.substr(0, digits.size() - decimals);
    std::string fraction = digits.substr(digits.size() - decimals);
    while (!fraction.empty() && fraction.back() == '0') {
        fraction.pop_back();
    }

    std::string out = is_negative() ? "-" : "";
    out += whole;
    if (!fraction.empty()) {
        out += "." + fraction;
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const Money& amount) {
    return os << amount.to_string();
}

} // namespace spl
