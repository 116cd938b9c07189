#ifndef SRC_FERRY_TRAP_HPP_
#define SRC_FERRY_TRAP_HPP_

#include <stdexcept>
#include <string>
#include <string_view>

namespace ferry {

// A runtime trap. Unconditionally aborts the unit of work that raised it; the Runtime catches it at the message
// boundary and discards the unit's effects. The prefix identifies the trapping subsystem.
class Trap : public std::runtime_error {
public:
    Trap(std::string_view prefix, std::string_view message);
    ~Trap() override = default;

    const std::string& prefix() const { return m_prefix; }
    const std::string& message() const { return m_message; }

private:
    std::string m_prefix;
    std::string m_message;
};

static constexpr std::string_view kIDLTrapPrefix = "IDL error: ";
static constexpr std::string_view kRTSTrapPrefix = "RTS error: ";

[[noreturn]] void trapWithPrefix(std::string_view prefix, std::string_view message);
// Malformed interface-encoded input.
[[noreturn]] void idlTrapWith(std::string_view message);
// Any other runtime system failure.
[[noreturn]] void rtsTrapWith(std::string_view message);

} // namespace ferry

#endif // SRC_FERRY_TRAP_HPP_
