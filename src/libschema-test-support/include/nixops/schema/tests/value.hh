#pragma once
///@file

#include <rapidcheck/gen/Arbitrary.h>

#include "nixops/schema/value.hh"

namespace rc {
using namespace nixops;

template<>
struct Arbitrary<ResourceHandle>
{
    static Gen<ResourceHandle> arbitrary();
};

/**
 * Values nested at most two levels deep.
 */
template<>
struct Arbitrary<Value>
{
    static Gen<Value> arbitrary();
};

} // namespace rc
