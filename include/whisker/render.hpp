/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2016-2024 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef WHISKER_RENDER_HPP_INCLUDED
#define WHISKER_RENDER_HPP_INCLUDED

#include <whisker/format.hpp>
#include <whisker/value.hpp>
#include <functional>
#include <optional>
#include <string>

namespace whisker
{
    enum class missing_key
    {
        ignore,
        warn,
        error
    };

    using partial_source = std::function<std::optional<std::string>(std::string const&)>;

    using warning_handler = std::function<void(std::string const&)>;

    struct render_options
    {
        bool escape_html = true;
        missing_key on_missing_key = missing_key::ignore;
        // Render unresolved variables as "{{ name }}" instead of nothing.
        bool keep_unresolved = false;
        // Nesting allowed for sections, partials and lambda output.
        unsigned max_depth = 256;
        partial_source partials;
        // Receives diagnostics under missing_key::warn, stderr if empty.
        warning_handler warn;
    };

    // Looks partials up in a map of template text. The map is referenced,
    // not copied.
    template<class Map>
    inline partial_source map_partials(Map const& map)
    {
        return [&map](std::string const& key) -> std::optional<std::string>
        {
            auto it = map.find(key);
            if (it == map.end())
                return std::nullopt;
            return std::string(it->second);
        };
    }

    struct manipulator
    {
        format const& fmt;
        value const& data;
        render_options opts;

        manipulator options(render_options o) const
        {
            return {fmt, data, std::move(o)};
        }

        manipulator partials(partial_source src) const
        {
            auto ret = *this;
            ret.opts.partials = std::move(src);
            return ret;
        }

        manipulator escape(bool enable) const
        {
            auto ret = *this;
            ret.opts.escape_html = enable;
            return ret;
        }

        manipulator on_missing(missing_key policy) const
        {
            auto ret = *this;
            ret.opts.on_missing_key = policy;
            return ret;
        }
    };

    inline manipulator format::operator()(value const& data) const
    {
        return {*this, data, {}};
    }
}

namespace whisker::detail
{
    struct strlit
    {
        char const* data;
        std::size_t size;

        constexpr strlit() : data(), size() {}

        template<std::size_t N>
        constexpr strlit(char const (&str)[N]) : data(str), size(N - 1) {}

        constexpr explicit operator bool() const
        {
            return !!data;
        }
    };

    inline strlit get_escaped(char c) noexcept
    {
        switch (c)
        {
        case '&': return "&amp;";
        case '<': return "&lt;";
        case '>': return "&gt;";
        case '"': return "&quot;";
        case '\'': return "&#39;";
        default:  return {};
        }
    }

    template<class Sink>
    struct escape_sink
    {
        Sink& sink;

        void operator()(char const* data, std::size_t bytes) const
        {
            auto it = data;
            auto last = it;
            auto const end = it + bytes;
            while (it != end)
            {
                if (auto const str = get_escaped(*it))
                {
                    sink(last, it - last);
                    sink(str.data, str.size);
                    last = ++it;
                }
                else
                    ++it;
            }
            sink(last, it - last);
        }
    };

    WHISKER_API void render
    (
        output_handler raw_os, output_handler escape_os, format const& fmt,
        value const& data, render_options const& opts
    );
}

namespace whisker
{
    template<class Sink>
    inline void render(Sink&& os, format const& fmt, value const& data, render_options const& opts = {})
    {
        if (opts.escape_html)
            detail::render(os, detail::escape_sink<Sink const>{os}, fmt, data, opts);
        else
            detail::render(os, os, fmt, data, opts);
    }
}

#endif
