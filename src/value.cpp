/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2014-2024 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#include <charconv>
#include <iterator>
#include <fmt/format.h>
#include <whisker/value.hpp>

namespace whisker::detail
{
    struct output_buffer
    {
        using value_type = char;

        explicit output_buffer(output_handler os) : os(os) {}

        void push_back(char c)
        {
            if (count == sizeof(buf)) [[unlikely]]
            {
                flush();
                count = 0;
            }
            buf[count++] = c;
        }

        void flush() { os(buf, count); }

        std::size_t count = 0;
        char buf[64];
        output_handler os;
    };

    template<class T>
    void print_fmt(T const& self, output_handler os)
    {
        output_buffer buf(os);
        fmt::format_to(std::back_inserter(buf), "{}", self);
        buf.flush();
    }
}

namespace whisker
{
    bool truthy(value const& val) noexcept
    {
        return std::visit([](auto const& self) -> bool
        {
            using T = std::decay_t<decltype(self)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>)
                return false;
            else if constexpr (std::is_same_v<T, bool>)
                return self;
            else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, array>)
                return !self.empty();
            else
                return true;
        }, static_cast<value::variant const&>(val));
    }

    void print(value const& val, output_handler os)
    {
        std::visit([os](auto const& self)
        {
            using T = std::decay_t<decltype(self)>;
            if constexpr (std::is_same_v<T, bool>)
                self ? os("true", 4) : os("false", 5);
            else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>)
                detail::print_fmt(self, os);
            else if constexpr (std::is_same_v<T, std::string>)
                os(self.data(), self.size());
        }, static_cast<value::variant const&>(val));
    }

    value const* get(value const& val, std::string_view key)
    {
        if (auto const obj = std::get_if<object>(&val))
        {
            auto const it = obj->find(key);
            return it == obj->end() ? nullptr : &it->second;
        }
        if (auto const arr = std::get_if<array>(&val))
        {
            std::size_t i = 0;
            auto const e = key.data() + key.size();
            auto const [p, ec] = std::from_chars(key.data(), e, i);
            if (ec != std::errc() || p != e || i >= arr->size())
                return nullptr;
            return &(*arr)[i];
        }
        return nullptr;
    }
}
