#include "nixops/schema/value.hh"
#include "nixops/util/error.hh"

#include <sstream>
#include <type_traits>

namespace nixops {

Value Value::mkList(ValueList elems)
{
    return Value(Raw(std::make_shared<const ValueList>(std::move(elems))));
}

Value Value::mkAttrs(Bindings attrs)
{
    return Value(Raw(std::make_shared<const Bindings>(std::move(attrs))));
}

ValueType Value::type() const
{
    return std::visit(
        [](const auto & x) -> ValueType {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::monostate>)
                return nNull;
            else if constexpr (std::is_same_v<T, bool>)
                return nBool;
            else if constexpr (std::is_same_v<T, NixInt>)
                return nInt;
            else if constexpr (std::is_same_v<T, std::string>)
                return nString;
            else if constexpr (std::is_same_v<T, std::shared_ptr<const ValueList>>)
                return nList;
            else if constexpr (std::is_same_v<T, std::shared_ptr<const Bindings>>)
                return nAttrs;
            else
                return nResource;
        },
        raw);
}

[[noreturn]] static void wrongType(const Value & v, ValueType expected)
{
    throw Error("expected %s but found %s: %s", showType(expected), showType(v), Uncolored(v));
}

bool Value::boolean() const
{
    if (auto b = std::get_if<bool>(&raw))
        return *b;
    wrongType(*this, nBool);
}

NixInt Value::integer() const
{
    if (auto n = std::get_if<NixInt>(&raw))
        return *n;
    wrongType(*this, nInt);
}

const std::string & Value::string() const
{
    if (auto s = std::get_if<std::string>(&raw))
        return *s;
    wrongType(*this, nString);
}

const ValueList & Value::list() const
{
    if (auto l = std::get_if<std::shared_ptr<const ValueList>>(&raw))
        return **l;
    wrongType(*this, nList);
}

const Bindings & Value::attrs() const
{
    if (auto a = std::get_if<std::shared_ptr<const Bindings>>(&raw))
        return **a;
    wrongType(*this, nAttrs);
}

const ResourceHandle & Value::resource() const
{
    if (auto h = std::get_if<ResourceHandle>(&raw))
        return *h;
    wrongType(*this, nResource);
}

const Value * Value::get(std::string_view name) const
{
    auto a = std::get_if<std::shared_ptr<const Bindings>>(&raw);
    if (!a)
        return nullptr;
    auto i = (*a)->find(name);
    return i == (*a)->end() ? nullptr : &i->second;
}

bool Value::operator==(const Value & other) const
{
    if (raw.index() != other.raw.index())
        return false;

    switch (type()) {
    case nList: {
        auto & l1 = list();
        auto & l2 = other.list();
        return &l1 == &l2 || l1 == l2;
    }
    case nAttrs: {
        auto & a1 = attrs();
        auto & a2 = other.attrs();
        return &a1 == &a2 || a1 == a2;
    }
    default:
        return raw == other.raw;
    }
}

static void printLiteralString(std::ostream & str, std::string_view s)
{
    str << "\"";
    for (auto c : s)
        if (c == '\"' || c == '\\')
            str << "\\" << c;
        else if (c == '\n')
            str << "\\n";
        else if (c == '\r')
            str << "\\r";
        else if (c == '\t')
            str << "\\t";
        else if (c == '$')
            str << "\\$";
        else
            str << c;
    str << "\"";
}

static bool isVarName(std::string_view s)
{
    if (s.empty())
        return false;
    if (s == "if" || s == "then" || s == "else" || s == "let" || s == "in" || s == "with" || s == "rec"
        || s == "inherit" || s == "assert" || s == "or")
        return false;
    char c = s[0];
    if ((c >= '0' && c <= '9') || c == '-' || c == '\'')
        return false;
    for (auto & i : s)
        if (!((i >= 'a' && i <= 'z') || (i >= 'A' && i <= 'Z') || (i >= '0' && i <= '9') || i == '_' || i == '-'
              || i == '\''))
            return false;
    return true;
}

void Value::print(std::ostream & str) const
{
    switch (type()) {
    case nNull:
        str << "null";
        break;
    case nBool:
        str << (boolean() ? "true" : "false");
        break;
    case nInt:
        str << integer();
        break;
    case nString:
        printLiteralString(str, string());
        break;
    case nList:
        str << "[ ";
        for (auto & elem : list()) {
            elem.print(str);
            str << " ";
        }
        str << "]";
        break;
    case nAttrs:
        str << "{ ";
        for (auto & [name, value] : attrs()) {
            if (isVarName(name))
                str << name;
            else
                printLiteralString(str, name);
            str << " = ";
            value.print(str);
            str << "; ";
        }
        str << "}";
        break;
    case nResource:
        str << "«resource " << resource().kind << " " << resource().name << "»";
        break;
    }
}

std::ostream & operator<<(std::ostream & str, const Value & v)
{
    v.print(str);
    return str;
}

std::string_view showType(ValueType type, bool withArticle)
{
#define WA(a, w) withArticle ? a " " w : w
    switch (type) {
    case nNull:
        return "null";
    case nBool:
        return WA("a", "Boolean");
    case nInt:
        return WA("an", "integer");
    case nString:
        return WA("a", "string");
    case nList:
        return WA("a", "list");
    case nAttrs:
        return WA("a", "set");
    case nResource:
        return WA("a", "resource handle");
    }
#undef WA
    panic("unknown value type");
}

std::string showType(const Value & v)
{
    if (v.type() == nResource)
        return fmt("a handle to a resource of type '%s'", v.resource().kind);
    return std::string(showType(v.type()));
}

Value mkStringList(const std::vector<std::string> & ss)
{
    ValueList elems;
    for (auto & s : ss)
        elems.push_back(Value::mkString(s));
    return Value::mkList(std::move(elems));
}

} // namespace nixops
