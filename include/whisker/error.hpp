/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2014-2024 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef WHISKER_ERROR_HPP_INCLUDED
#define WHISKER_ERROR_HPP_INCLUDED

#include <stdexcept>
#include <cstddef>
#include <string>

#if defined(_WIN32)
#   ifdef WHISKER_EXPORT
#       define WHISKER_API __declspec(dllexport)
#   elif defined(WHISKER_SHARED)
#       define WHISKER_API __declspec(dllimport)
#   endif
#endif
#ifndef WHISKER_API
#   define WHISKER_API
#endif

namespace whisker
{
    enum error_type
    {
        error_set_delim,
        error_baddelim,
        error_delim,
        error_section,
        error_unopened,
        error_unclosed,
        error_badkey
    };

    class syntax_error : public std::runtime_error
    {
        error_type _err;
        std::ptrdiff_t _pos;
        unsigned _line;
        unsigned _column;

    public:
        WHISKER_API syntax_error(error_type err, std::ptrdiff_t position, unsigned line, unsigned column);

        error_type code() const noexcept { return _err; }
        std::ptrdiff_t position() const noexcept { return _pos; }
        unsigned line() const noexcept { return _line; }
        unsigned column() const noexcept { return _column; }
    };

    class render_error : public std::runtime_error
    {
        unsigned _line;
        unsigned _column;

    public:
        render_error(std::string const& msg, unsigned line, unsigned column)
          : runtime_error(msg), _line(line), _column(column)
        {}

        unsigned line() const noexcept { return _line; }
        unsigned column() const noexcept { return _column; }
    };

    class missing_key_error : public render_error
    {
        std::string _key;

    public:
        WHISKER_API missing_key_error(std::string key, unsigned line, unsigned column);

        std::string const& key() const noexcept { return _key; }
    };

    class missing_partial_error : public render_error
    {
        std::string _key;

    public:
        WHISKER_API missing_partial_error(std::string key, unsigned line, unsigned column);

        std::string const& key() const noexcept { return _key; }
    };

    class recursion_limit_exceeded : public render_error
    {
        unsigned _depth;

    public:
        WHISKER_API recursion_limit_exceeded(unsigned depth, unsigned line, unsigned column);

        unsigned depth() const noexcept { return _depth; }
    };

    WHISKER_API char const* get_error_string(error_type err) noexcept;
}

#endif
