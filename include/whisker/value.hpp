/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2014-2024 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef WHISKER_VALUE_HPP_INCLUDED
#define WHISKER_VALUE_HPP_INCLUDED

#include <whisker/error.hpp>
#include <algorithm>
#include <concepts>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace whisker::detail
{
    template<class T>
    inline T const& deref_data(void const* p)
    {
        return *static_cast<T const*>(p);
    }

    template<class>
    struct fn_base;

    template<class R, class... T>
    struct fn_base<R(T...)>
    {
        fn_base() noexcept : _data(), _call() {}

        template<class F>
        fn_base(F const& f) noexcept : _data(&f), _call(call<F>) {}

        R operator()(T... t) const
        {
            return _call(_data, std::forward<T>(t)...);
        }

        template<class F>
        static R call(void const* f, T&&... t)
        {
            return deref_data<F>(f)(std::forward<T>(t)...);
        }

        void const* _data;
        R(*_call)(void const*, T&&...);
    };
}

namespace whisker
{
    template<class F, class R, class... T>
    concept Callable = requires(F const& f, T... t)
    {
        {f(t...)} -> std::convertible_to<R>;
    };

    // Non-owning reference to a callable, only valid during the call it is
    // passed to.
    template<class>
    class fn_ref;

    template<class R, class... T>
    class fn_ref<R(T...)> : detail::fn_base<R(T...)>
    {
        using base_t = detail::fn_base<R(T...)>;

    public:
        template<Callable<R, T...> F>
        fn_ref(F const& f) noexcept : base_t(f) {}

        using base_t::operator();
    };

    using output_handler = fn_ref<void(char const*, std::size_t)>;

    struct value;

    // Renders a template string against the current context, with an
    // optional extra frame pushed on top.
    using render_handler = fn_ref<std::string(std::string_view, value const*)>;

    using lambda = std::function<std::string(std::string_view text, render_handler render)>;

    using array = std::vector<value>;

    struct object : std::vector<std::pair<std::string, value>>
    {
        using vector::vector;

        const_iterator find(std::string_view key) const;
    };

    struct value : std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, array, object, lambda>
    {
        using variant::variant;

        value() = default;

        value(char const* str) : variant(std::string(str)) {}

        value(std::string_view str) : variant(std::string(str)) {}

        // Integers the variant rejects as narrowing. Unsigned values above
        // INT64_MAX are stored as double.
        template<std::integral T> requires (!std::is_constructible_v<variant, T>)
        value(T i) : variant(from_integer(i)) {}

        template<std::integral T>
        static variant from_integer(T i)
        {
            if constexpr (std::is_unsigned_v<T>)
            {
                if (i > std::uint64_t(std::numeric_limits<std::int64_t>::max()))
                    return double(i);
            }
            return std::int64_t(i);
        }
    };

    inline object::const_iterator object::find(std::string_view key) const
    {
        return std::find_if(begin(), end(), [key](value_type const& pair)
        {
            return pair.first == key;
        });
    }

    // Mustache truthiness: null, false, "" and [] are falsy.
    WHISKER_API bool truthy(value const& val) noexcept;

    // Writes the interpolated form of a scalar. Containers and lambdas print nothing.
    WHISKER_API void print(value const& val, output_handler os);

    // Single-level lookup of an object member or an array index.
    WHISKER_API value const* get(value const& val, std::string_view key);
}

#endif
