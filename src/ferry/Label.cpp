#include "ferry/Label.hpp"

#include "fmt/format.h"

#include <limits>

namespace {

// Parses a non-empty string of decimal digits that fits in 32 bits.
bool parseNumber(std::string_view digits, uint32_t& number) {
    if (digits.empty()) {
        return false;
    }
    uint64_t value = 0;
    for (auto c : digits) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = (value * 10) + static_cast<uint64_t>(c - '0');
        if (value > std::numeric_limits<uint32_t>::max()) {
            return false;
        }
    }
    number = static_cast<uint32_t>(value);
    return true;
}

} // namespace

namespace ferry {

Label Label::fromNumber(uint32_t number) {
    Label label;
    label.m_isNumber = true;
    label.m_number = number;
    return label;
}

Label Label::fromName(std::string name) {
    Label label;
    label.m_isNumber = false;
    label.m_name = std::move(name);
    return label;
}

Label Label::unescape(std::string_view escaped) {
    auto length = escaped.size();
    if (length >= 2 && escaped.back() == '_') {
        uint32_t number = 0;
        if (escaped.front() == '_' && length >= 3 && parseNumber(escaped.substr(1, length - 2), number)) {
            return fromNumber(number);
        }
        return fromName(std::string(escaped.substr(0, length - 1)));
    }
    return fromName(std::string(escaped));
}

Hash Label::id() const {
    if (m_isNumber) {
        return m_number;
    }
    return idlHash(m_name);
}

std::string Label::displayName() const {
    if (m_isNumber) {
        return fmt::format("{}", m_number);
    }
    return m_name;
}

} // namespace ferry
