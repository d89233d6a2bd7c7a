#pragma once
///@file

#include <string>
#include <string_view>

namespace nixops {

/**
 * Whether stderr is a terminal that understands colours: not a pipe,
 * `TERM` is not `dumb`, and neither `NO_COLOR` nor `NOCOLOR` is set.
 */
bool isTTY();

/**
 * Remove ANSI escape sequences from `s`. Colour sequences (`ESC [ ... m`)
 * are kept unless `filterAll` is set. Carriage returns and bells are
 * dropped as well.
 */
std::string filterANSIEscapes(std::string_view s, bool filterAll = false);

} // namespace nixops
