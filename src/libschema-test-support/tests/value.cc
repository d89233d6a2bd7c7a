#include <exception> // Needed by rapidcheck on Darwin
#include <rapidcheck.h>

#include "nixops/schema/tests/value.hh"

namespace rc {
using namespace nixops;

Gen<ResourceHandle> Arbitrary<ResourceHandle>::arbitrary()
{
    return gen::build<ResourceHandle>(
        gen::set(
            &ResourceHandle::kind,
            gen::element<std::string>("azure-resource-group", "azure-network-security-group", "azure-virtual-network")),
        gen::set(&ResourceHandle::name, gen::nonEmpty(gen::string<std::string>())));
}

static Gen<Value> scalarValue()
{
    return gen::oneOf(
        gen::just(Value::mkNull()),
        gen::map(gen::arbitrary<bool>(), [](bool b) { return Value::mkBool(b); }),
        gen::map(gen::arbitrary<NixInt>(), [](NixInt n) { return Value::mkInt(n); }),
        gen::map(gen::arbitrary<std::string>(), [](std::string s) { return Value::mkString(std::move(s)); }),
        gen::map(gen::arbitrary<ResourceHandle>(), [](ResourceHandle h) { return Value::mkResource(std::move(h)); }));
}

static Gen<Value> value(unsigned int depth)
{
    if (depth == 0)
        return scalarValue();

    return gen::oneOf(
        scalarValue(),
        gen::map(
            gen::container<std::vector<Value>>(value(depth - 1)),
            [](std::vector<Value> elems) { return Value::mkList(std::move(elems)); }),
        gen::map(
            gen::container<std::map<std::string, Value>>(gen::arbitrary<std::string>(), value(depth - 1)),
            [](std::map<std::string, Value> attrs) { return Value::mkAttrs(Bindings(attrs.begin(), attrs.end())); }));
}

Gen<Value> Arbitrary<Value>::arbitrary()
{
    return value(2);
}

} // namespace rc
