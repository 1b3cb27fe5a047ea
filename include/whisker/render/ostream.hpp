/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2016-2024 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef WHISKER_RENDER_OSTREAM_HPP_INCLUDED
#define WHISKER_RENDER_OSTREAM_HPP_INCLUDED

#include <iostream>
#include <whisker/render.hpp>

namespace whisker { namespace detail
{
    template<class CharT, class Traits>
    struct ostream_sink
    {
        std::basic_ostream<CharT, Traits>& out;

        void operator()(char const* data, std::size_t bytes) const
        {
            out.write(data, bytes);
        }
    };
}}

namespace whisker
{
    template<class CharT, class Traits>
    inline void render_ostream
    (
        std::basic_ostream<CharT, Traits>& out, format const& fmt,
        value const& data, render_options const& opts = {}
    )
    {
        render(detail::ostream_sink<CharT, Traits>{out}, fmt, data, opts);
    }

    template<class CharT, class Traits>
    inline std::basic_ostream<CharT, Traits>&
    operator<<(std::basic_ostream<CharT, Traits>& out, manipulator const& manip)
    {
        render_ostream(out, manip.fmt, manip.data, manip.opts);
        return out;
    }
}

#endif
