#include "ferry/Trap.hpp"

#include "fmt/format.h"

namespace ferry {

Trap::Trap(std::string_view prefix, std::string_view message):
    std::runtime_error(fmt::format("{}{}", prefix, message)), m_prefix(prefix), m_message(message) { }

void trapWithPrefix(std::string_view prefix, std::string_view message) { throw Trap(prefix, message); }

void idlTrapWith(std::string_view message) { trapWithPrefix(kIDLTrapPrefix, message); }

void rtsTrapWith(std::string_view message) { trapWithPrefix(kRTSTrapPrefix, message); }

} // namespace ferry
