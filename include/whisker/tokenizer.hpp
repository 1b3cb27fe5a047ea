/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2014-2024 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef WHISKER_TOKENIZER_HPP_INCLUDED
#define WHISKER_TOKENIZER_HPP_INCLUDED

#include <whisker/error.hpp>
#include <string_view>
#include <optional>
#include <cstddef>

namespace whisker
{
    enum class token_kind
    {
        text,
        variable,
        unescaped,
        section,
        inversion,
        close,
        partial,
        comment,
        set_delim
    };

    struct delimiters
    {
        std::string_view open = "{{";
        std::string_view close = "}}";
    };

    struct token
    {
        token_kind kind;
        // The text run, the trimmed tag name, or the body of a set-delimiter tag.
        std::string_view content;
        // The whole tag including its delimiters.
        std::string_view raw;
        std::size_t begin;
        std::size_t end;
        unsigned line;
        unsigned column;
        bool standalone;
        // Only meaningful for standalone tags.
        std::string_view indent;
        std::size_t line_end;

        bool is_tag() const noexcept { return kind != token_kind::text; }
    };

    // Splits a template into text runs and tags, one token per call.
    // The delimiter pair changes as set-delimiter tags are consumed.
    class tokenizer
    {
    public:
        explicit tokenizer(std::string_view source, delimiters d = {}) noexcept;

        std::optional<token> next();

        delimiters const& delims() const noexcept { return _d; }

        std::string_view source() const noexcept { return {_b, std::size_t(_e - _b)}; }

    private:
        using I = char const*;

        token make_text(I end);
        token make_tag(I open);
        void advance(I to) noexcept;
        [[noreturn]] void fail(error_type err, I pos) const;

        I _b;
        I _i;
        I _e;
        delimiters _d;
        unsigned _line;
        I _bol;
    };

    inline bool is_standalone_kind(token_kind kind) noexcept
    {
        switch (kind)
        {
        case token_kind::section:
        case token_kind::inversion:
        case token_kind::close:
        case token_kind::partial:
        case token_kind::comment:
        case token_kind::set_delim:
            return true;
        default:
            return false;
        }
    }
}

#endif
