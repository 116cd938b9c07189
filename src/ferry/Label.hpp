#ifndef SRC_FERRY_LABEL_HPP_
#define SRC_FERRY_LABEL_HPP_

#include "ferry/Hash.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace ferry {

// A record, object or variant field label: either a numeric index or a textual identifier. Both forms map to the
// numeric field id that appears on the wire.
class Label {
public:
    Label(): m_isNumber(true), m_number(0) { }
    ~Label() = default;

    static Label fromNumber(uint32_t number);
    static Label fromName(std::string name);
    // Undoes the front end's label escaping: "_<digits>_" is the numeric label <digits>, a single trailing underscore
    // is dropped (it lets keywords serve as labels), anything else is textual as written.
    static Label unescape(std::string_view escaped);

    bool isNumber() const { return m_isNumber; }
    uint32_t number() const { return m_number; }
    const std::string& name() const { return m_name; }

    // Wire identifier: the number itself for numeric labels, idlHash() of the name for textual ones.
    Hash id() const;
    // Name shown in the interface description: the decimal rendering for numeric labels, the name for textual ones.
    std::string displayName() const;

    bool operator==(const Label& l) const {
        return m_isNumber == l.m_isNumber && m_number == l.m_number && m_name == l.m_name;
    }
    bool operator!=(const Label& l) const { return !(*this == l); }

private:
    bool m_isNumber;
    uint32_t m_number;
    std::string m_name;
};

} // namespace ferry

#endif // SRC_FERRY_LABEL_HPP_
