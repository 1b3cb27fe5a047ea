/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2014-2024 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#include <algorithm>
#include <cassert>
#include <cstring>
#include <exception>
#include <fmt/format.h>
#include <whisker/format.hpp>

namespace whisker::parser { namespace
{
    struct open_block
    {
        unsigned index;
        token tag;
    };

    struct parser
    {
        ast::context& ctx;
        ast::content_list& root;
        tokenizer tok;
        std::vector<open_block> stack;
        // Where the line of the last standalone tag ends, to be cut from
        // the next text token.
        std::size_t trim_from = std::size_t(-1);
        std::size_t trim_to = 0;

        ast::content_list& current()
        {
            return stack.empty() ? root : ctx.blocks[stack.back().index].contents;
        }

        [[noreturn]] void fail(error_type err, token const& tag) const
        {
            throw syntax_error(err, std::ptrdiff_t(tag.begin), tag.line, tag.column);
        }

        ast::location loc(token const& tag) const
        {
            return {tag.line, tag.column};
        }

        void trim_before(ast::content_list& list, token const& tag);

        void expect_text(token const& tag);

        void expect_block(token const& tag);

        void expect_close(token const& tag);

        void parse();
    };

    // Drop the indentation in front of a standalone tag. It is always the
    // tail of the preceding text node, when that node ends at the tag.
    void parser::trim_before(ast::content_list& list, token const& tag)
    {
        if (!tag.standalone || list.empty())
            return;
        auto const last = list.back();
        if (last.kind != ast::type::text)
            return;
        auto& text = ctx.texts[last.index];
        auto const base = tok.source().data();
        if (text.data() + text.size() != base + tag.begin)
            return;
        text.remove_suffix(tag.indent.size());
        if (text.empty())
            list.pop_back();
    }

    void parser::expect_text(token const& tag)
    {
        auto text = tag.content;
        if (trim_from == tag.begin)
            text.remove_prefix(std::min(trim_to - trim_from, text.size()));
        if (!text.empty())
            current().push_back(ctx.add(text));
    }

    void parser::expect_block(token const& tag)
    {
        trim_before(current(), tag);
        ast::block a;
        a.key = tag.content;
        a.open_delim = tok.delims().open;
        a.close_delim = tok.delims().close;
        a.loc = loc(tag);
        auto const kind = tag.kind == token_kind::section ? ast::type::section : ast::type::inversion;
        auto const c = ctx.add(kind, std::move(a));
        current().push_back(c);
        stack.push_back({c.index, tag});
    }

    void parser::expect_close(token const& tag)
    {
        if (stack.empty())
            fail(error_unopened, tag);
        auto const& open = stack.back();
        auto& block = ctx.blocks[open.index];
        if (block.key != tag.content)
            fail(error_section, tag);
        trim_before(block.contents, tag);

        auto const base = tok.source().data();
        std::size_t body_begin = open.tag.standalone ? open.tag.line_end : open.tag.end;
        std::size_t body_end = tag.standalone ? tag.begin - tag.indent.size() : tag.begin;
        if (body_end < body_begin)
            body_end = body_begin;
        block.raw = std::string_view(base + body_begin, body_end - body_begin);
        stack.pop_back();
    }

    void parser::parse()
    {
        while (auto const next = tok.next())
        {
            token const& tag = *next;
            switch (tag.kind)
            {
            case token_kind::text:
                expect_text(tag);
                break;
            case token_kind::variable:
            case token_kind::unescaped:
            {
                auto const kind = tag.kind == token_kind::variable ? ast::type::var_escaped : ast::type::var_raw;
                current().push_back(ctx.add(kind, ast::variable{std::string(tag.content), loc(tag)}));
                break;
            }
            case token_kind::section:
            case token_kind::inversion:
                expect_block(tag);
                break;
            case token_kind::close:
                expect_close(tag);
                break;
            case token_kind::partial:
            {
                auto& list = current();
                trim_before(list, tag);
                ast::partial a;
                a.key = tag.content;
                if (tag.standalone)
                    a.indent = tag.indent;
                a.loc = loc(tag);
                list.push_back(ctx.add(std::move(a)));
                break;
            }
            case token_kind::comment:
            case token_kind::set_delim:
                trim_before(current(), tag);
                break;
            }
            if (tag.standalone)
            {
                trim_from = tag.end;
                trim_to = tag.line_end;
            }
            else
                trim_from = std::size_t(-1);
        }
        if (!stack.empty())
            fail(error_unclosed, stack.back().tag);
    }
}}

namespace whisker
{
    char const* get_error_string(error_type err) noexcept
    {
        switch (err)
        {
        case error_set_delim:
            return "mismatched '='";
        case error_baddelim:
            return "invalid delimiter";
        case error_delim:
            return "unclosed tag";
        case error_section:
            return "mismatched section close";
        case error_unopened:
            return "unexpected section close";
        case error_unclosed:
            return "unclosed section";
        case error_badkey:
            return "invalid key";
        default:
            assert(!"should not happen");
            std::terminate();
        }
    }

    syntax_error::syntax_error(error_type err, std::ptrdiff_t pos, unsigned line, unsigned column)
      : runtime_error(fmt::format("{} at line {}, column {}", get_error_string(err), line, column))
      , _err(err), _pos(pos), _line(line), _column(column)
    {}

    void format::init(std::string_view source, delimiters d)
    {
        _size = source.size();
        _text.reset(new char[_size ? _size : 1]);
        if (_size)
            std::memcpy(_text.get(), source.data(), _size);
        parser::parser p{_doc.ctx, _doc.contents, tokenizer(this->source(), d)};
        p.parse();
    }

    void format::copy_text(char const* old, std::size_t n)
    {
        _size = n;
        _text.reset(new char[n ? n : 1]);
        if (n)
            std::memcpy(_text.get(), old, n);
        auto const rebase = [&](std::string_view& s)
        {
            if (!s.empty())
                s = std::string_view(_text.get() + (s.data() - old), s.size());
        };
        for (auto& text : _doc.ctx.texts)
            rebase(text);
        for (auto& block : _doc.ctx.blocks)
            rebase(block.raw);
    }
}
