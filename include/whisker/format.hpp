/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2014-2024 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef WHISKER_FORMAT_HPP_INCLUDED
#define WHISKER_FORMAT_HPP_INCLUDED

#include <whisker/ast.hpp>
#include <whisker/error.hpp>
#include <whisker/tokenizer.hpp>
#include <cstddef>
#include <utility>
#include <memory>

namespace whisker
{
    struct value;
    struct manipulator;

    // A parsed template. The source text is copied, so the format does not
    // depend on the lifetime of the string it was built from.
    class format
    {
    public:
        format() = default;

        explicit format(std::string_view source, delimiters d = {})
        {
            init(source, d);
        }

        format(format&& other) = default;

        format(format const& other) : _doc(other._doc)
        {
            copy_text(other._text.get(), other._size);
        }

        format& operator=(format&& other) = default;

        format& operator=(format const& other)
        {
            return operator=(format(other));
        }

        // Defined in <whisker/render.hpp>.
        manipulator operator()(value const& data) const;

        ast::document const& doc() const noexcept
        {
            return _doc;
        }

        std::string_view source() const noexcept
        {
            return {_text.get(), _size};
        }

    private:
        WHISKER_API void init(std::string_view source, delimiters d);
        WHISKER_API void copy_text(char const* old, std::size_t n);

        ast::document _doc;
        std::unique_ptr<char[]> _text;
        std::size_t _size = 0;
    };

    inline namespace literals
    {
        inline format operator"" _fmt(char const* str, std::size_t n)
        {
            return format(std::string_view(str, n));
        }
    }
}

#endif
