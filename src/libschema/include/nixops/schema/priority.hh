#pragma once
///@file

#include <compare>
#include <optional>
#include <string_view>

namespace nixops {

/**
 * How strongly a definition of an option insists on its value. When
 * an option has definitions at several priorities, only those at the
 * highest one are considered.
 */
enum class Priority {
    /**
     * A default supplied by the option declaration or by the module
     * (`mkDefault`).
     */
    Default = 0,
    /**
     * An ordinary value supplied by the user.
     */
    Normal = 1,
    /**
     * A value that must win over user values (`mkForce`).
     */
    Force = 2,
};

std::string_view showPriority(Priority priority);

std::optional<Priority> parsePriority(std::string_view s);

} // namespace nixops
