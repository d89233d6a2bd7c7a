#pragma once
///@file

#include <type_traits>
#include <utility>
#include <variant>

/**
 * Forwarding constructor for wrapper types. All args are forwarded to
 * the construction of the "raw" field. Also defaults the copy and move
 * operations.
 *
 * The moral equivalent of `using Raw::Raw;`
 */
#define MAKE_WRAPPER_CONSTRUCTOR(CLASS_NAME)                                                                \
    CLASS_NAME(CLASS_NAME &&) = default;                                                                    \
    CLASS_NAME & operator=(CLASS_NAME &&) = default;                                                        \
    CLASS_NAME(const CLASS_NAME &) = default;                                                               \
    CLASS_NAME(CLASS_NAME &) = default;                                                                     \
    CLASS_NAME & operator=(const CLASS_NAME &) = default;                                                   \
    CLASS_NAME & operator=(CLASS_NAME &) = default;                                                         \
                                                                                                            \
    template<typename... Args>                                                                              \
        requires(!(sizeof...(Args) == 1 && (std::is_same_v<std::remove_cvref_t<Args>, CLASS_NAME> && ...))) \
    CLASS_NAME(Args &&... arg)                                                                              \
        : raw(std::forward<Args>(arg)...)                                                                   \
    {                                                                                                       \
    }
