#pragma once
///@file

#include <string>
#include <string_view>
#include <vector>

namespace nixops {

/**
 * The address of an option, e.g. `["subnets" "default" "addressPrefix"]`.
 */
typedef std::vector<std::string> AttrPath;

/**
 * Parse a dotted option path. Components containing dots can be
 * quoted, e.g. `subnets."10.1".addressPrefix`.
 */
AttrPath parseAttrPath(std::string_view s);

/**
 * Render a path in the syntax accepted by `parseAttrPath`.
 */
std::string showAttrPath(const AttrPath & path);

AttrPath operator+(const AttrPath & prefix, const std::string & attr);

AttrPath operator+(const AttrPath & prefix, const AttrPath & suffix);

} // namespace nixops
