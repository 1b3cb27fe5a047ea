/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2016-2024 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef WHISKER_RENDER_STRING_HPP_INCLUDED
#define WHISKER_RENDER_STRING_HPP_INCLUDED

#include <string>
#include <whisker/render.hpp>

namespace whisker::detail
{
    template<class String>
    struct string_appender
    {
        String& out;

        void operator()(char const* data, std::size_t bytes) const
        {
            out.insert(out.end(), data, data + bytes);
        }
    };
}

namespace whisker
{
    template<class String>
    inline void render_string
    (
        String& out, format const& fmt, value const& data,
        render_options const& opts = {}
    )
    {
        render(detail::string_appender<String>{out}, fmt, data, opts);
    }

    // Parses and renders in one go.
    inline std::string render(std::string_view source, value const& data, render_options const& opts = {})
    {
        std::string ret;
        render_string(ret, format(source), data, opts);
        return ret;
    }

    inline std::string to_string(manipulator const& manip)
    {
        std::string ret;
        render_string(ret, manip.fmt, manip.data, manip.opts);
        return ret;
    }
}

#endif
