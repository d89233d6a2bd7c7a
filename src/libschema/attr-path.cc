#include "nixops/schema/attr-path.hh"
#include "nixops/util/error.hh"

namespace nixops {

AttrPath parseAttrPath(std::string_view s)
{
    AttrPath res;
    std::string cur;
    auto i = s.begin();
    while (i != s.end()) {
        if (*i == '.') {
            res.push_back(cur);
            cur.clear();
        } else if (*i == '"') {
            ++i;
            while (1) {
                if (i == s.end())
                    throw Error("missing closing quote in option path '%1%'", s);
                if (*i == '"')
                    break;
                cur.push_back(*i++);
            }
        } else
            cur.push_back(*i);
        ++i;
    }
    if (!cur.empty())
        res.push_back(cur);
    for (auto & attr : res)
        if (attr.empty())
            throw Error("option path '%1%' has an empty component", s);
    return res;
}

std::string showAttrPath(const AttrPath & path)
{
    std::string res;
    bool first = true;
    for (auto & attr : path) {
        if (!first)
            res += '.';
        first = false;
        if (attr.find('.') != attr.npos || attr.empty())
            res += '"' + attr + '"';
        else
            res += attr;
    }
    return res;
}

AttrPath operator+(const AttrPath & prefix, const std::string & attr)
{
    auto res = prefix;
    res.push_back(attr);
    return res;
}

AttrPath operator+(const AttrPath & prefix, const AttrPath & suffix)
{
    auto res = prefix;
    res.insert(res.end(), suffix.begin(), suffix.end());
    return res;
}

} // namespace nixops
