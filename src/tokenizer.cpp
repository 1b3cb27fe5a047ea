/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2014-2024 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#include <whisker/tokenizer.hpp>
#include <string>

namespace whisker { namespace
{
    using I = char const*;

    constexpr bool is_space(char c)
    {
        switch (c)
        {
        case ' ':
        case '\f':
        case '\n':
        case '\r':
        case '\t':
        case '\v':
            return true;
        }
        return false;
    }

    constexpr bool is_blank(char c)
    {
        return c == ' ' || c == '\t';
    }

    // Return true if it ends.
    inline bool skip(I& i, I e) noexcept
    {
        while (i != e)
        {
            if (!is_space(*i))
                return false;
            ++i;
        }
        return true;
    }

    std::string_view trim(std::string_view s) noexcept
    {
        while (!s.empty() && is_space(s.front()))
            s.remove_prefix(1);
        while (!s.empty() && is_space(s.back()))
            s.remove_suffix(1);
        return s;
    }

    // Split "open close" into two delimiters, false if malformed.
    bool split_delims(std::string_view body, delimiters& d) noexcept
    {
        I i = body.data();
        I const e = i + body.size();
        std::string_view parts[2];
        for (auto& part : parts)
        {
            if (skip(i, e))
                return false;
            I const i0 = i;
            while (i != e && !is_space(*i))
            {
                if (*i == '=')
                    return false;
                ++i;
            }
            part = std::string_view(i0, i - i0);
        }
        if (!skip(i, e))
            return false;
        d.open = parts[0];
        d.close = parts[1];
        return true;
    }
}}

namespace whisker
{
    tokenizer::tokenizer(std::string_view source, delimiters d) noexcept
      : _b(source.data()), _i(_b), _e(_b + source.size())
      , _d(d), _line(1), _bol(_b)
    {}

    std::optional<token> tokenizer::next()
    {
        if (_i == _e)
            return std::nullopt;
        auto const pos = std::string_view(_i, _e - _i).find(_d.open);
        if (pos == std::string_view::npos)
            return make_text(_e);
        if (pos)
            return make_text(_i + pos);
        return make_tag(_i);
    }

    void tokenizer::advance(I to) noexcept
    {
        for (; _i != to; ++_i)
        {
            if (*_i == '\n')
            {
                ++_line;
                _bol = _i + 1;
            }
        }
    }

    void tokenizer::fail(error_type err, I pos) const
    {
        unsigned line = 1;
        I bol = _b;
        for (I i = _b; i != pos; ++i)
        {
            if (*i == '\n')
            {
                ++line;
                bol = i + 1;
            }
        }
        throw syntax_error(err, pos - _b, line, unsigned(pos - bol) + 1);
    }

    token tokenizer::make_text(I end)
    {
        std::string_view const text(_i, end - _i);
        token ret{token_kind::text, text, text, std::size_t(_i - _b), std::size_t(end - _b),
            _line, unsigned(_i - _bol) + 1, false, {}, std::size_t(end - _b)};
        advance(end);
        return ret;
    }

    token tokenizer::make_tag(I open)
    {
        I i = open + _d.open.size();
        if (skip(i, _e))
            fail(error_delim, open);

        token_kind kind = token_kind::variable;
        bool triple = false;
        switch (*i)
        {
        case '#': kind = token_kind::section; ++i; break;
        case '^': kind = token_kind::inversion; ++i; break;
        case '/': kind = token_kind::close; ++i; break;
        case '>': kind = token_kind::partial; ++i; break;
        case '!': kind = token_kind::comment; ++i; break;
        case '=': kind = token_kind::set_delim; ++i; break;
        case '&': kind = token_kind::unescaped; ++i; break;
        case '{': kind = token_kind::unescaped; triple = true; ++i; break;
        default: break;
        }

        std::string const term = triple ? "}" + std::string(_d.close) : std::string(_d.close);
        std::string_view const rest(i, _e - i);
        auto const at = rest.find(term);
        if (at == std::string_view::npos)
            fail(error_delim, open);
        I const tag_end = i + at + term.size();
        std::string_view content = rest.substr(0, at);

        delimiters next_d = _d;
        switch (kind)
        {
        case token_kind::comment:
            break;
        case token_kind::set_delim:
        {
            auto body = trim(content);
            if (body.empty() || body.back() != '=')
                fail(error_set_delim, i + at);
            body.remove_suffix(1);
            if (!split_delims(body, next_d))
                fail(error_baddelim, i);
            content = trim(body);
            break;
        }
        default:
            content = trim(content);
            if (content.empty())
                fail(error_badkey, i);
            for (char c : content)
            {
                if (is_space(c))
                    fail(error_badkey, content.data());
            }
            break;
        }

        token ret{kind, content, std::string_view(open, tag_end - open),
            std::size_t(open - _b), std::size_t(tag_end - _b),
            _line, unsigned(open - _bol) + 1, false, {}, std::size_t(tag_end - _b)};

        if (is_standalone_kind(kind))
        {
            I s = open;
            while (s != _b && is_blank(s[-1]))
                --s;
            if (s == _b || s[-1] == '\n')
            {
                I t = tag_end;
                while (t != _e && is_blank(*t))
                    ++t;
                if (t == _e)
                    ret.standalone = true;
                else if (*t == '\n')
                    ret.standalone = true, ++t;
                else if (*t == '\r' && t + 1 != _e && t[1] == '\n')
                    ret.standalone = true, t += 2;
                if (ret.standalone)
                {
                    ret.indent = std::string_view(s, open - s);
                    ret.line_end = std::size_t(t - _b);
                }
            }
        }

        _d = next_d;
        advance(tag_end);
        return ret;
    }
}
