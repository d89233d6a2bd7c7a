#pragma once
///@file

#include <memory>
#include <stdexcept>

namespace nixops {

/**
 * A `std::shared_ptr` that is never null. Types, option sets and
 * modules are shared through it.
 */
template<typename T>
class ref
{
    std::shared_ptr<T> p;

public:

    using element_type = T;

    explicit ref(std::shared_ptr<T> p)
        : p(std::move(p))
    {
        if (!this->p)
            throw std::invalid_argument("null pointer cast to ref");
    }

    T * operator->() const
    {
        return p.get();
    }

    T & operator*() const
    {
        return *p;
    }

    std::shared_ptr<T> get_ptr() const
    {
        return p;
    }

    /* Upcasts, e.g. `ref<StrType>` to `Type`. */
    template<typename T2>
    operator ref<T2>() const
    {
        return ref<T2>(std::shared_ptr<T2>(p));
    }

    bool operator==(const ref<T> & other) const = default;
};

template<typename T, typename... Args>
inline ref<T> make_ref(Args &&... args)
{
    return ref<T>(std::make_shared<T>(std::forward<Args>(args)...));
}

} // namespace nixops
