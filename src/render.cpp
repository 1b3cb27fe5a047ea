/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2016-2024 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/

#include <whisker/render.hpp>
#include <fmt/format.h>
#include <cassert>
#include <cstdio>

namespace whisker::detail
{
    // One frame of the context stack, linked to the enclosing frame.
    struct content_scope
    {
        content_scope const* const parent;
        value const* data;
    };

    // The innermost frame that has the key wins.
    value const* lookup(content_scope const* scope, std::string_view key)
    {
        do
        {
            if (auto const val = get(*scope->data, key))
                return val;
            scope = scope->parent;
        } while (scope);
        return nullptr;
    }

    struct depth_guard
    {
        unsigned& depth;

        ~depth_guard() { --depth; }
    };

    struct string_sink
    {
        std::string& out;

        void operator()(char const* data, std::size_t bytes) const
        {
            out.append(data, bytes);
        }
    };

    struct content_visitor
    {
        ast::context const* ctx;
        content_scope const* scope;

        output_handler raw_os;
        output_handler escape_os;
        render_options const& opts;
        unsigned depth;
        std::string indent;
        bool needs_indent;

        content_visitor
        (
            ast::context const& ctx, content_scope const& scope,
            output_handler raw_os, output_handler escape_os,
            render_options const& opts, unsigned depth
        )
            : ctx(&ctx), scope(&scope)
            , raw_os(raw_os), escape_os(escape_os), opts(opts)
            , depth(depth), needs_indent()
        {}

        content_visitor(content_visitor const&) = delete;

        // Resolves a possibly dotted name. Only the first segment searches
        // the context stack, the rest are looked up in the value found.
        value const* resolve(std::string_view key) const
        {
            if (key == ".")
                return scope->data;
            auto dot = key.find('.');
            auto val = lookup(scope, key.substr(0, dot));
            while (val && dot != std::string_view::npos)
            {
                auto const next = key.find('.', dot + 1);
                val = get(*val, key.substr(dot + 1, next - dot - 1));
                dot = next;
            }
            return val;
        }

        depth_guard enter(ast::location loc)
        {
            if (++depth > opts.max_depth)
            {
                --depth;
                throw recursion_limit_exceeded(opts.max_depth, loc.line, loc.column);
            }
            return {depth};
        }

        void unresolved(std::string const& key, ast::location loc, bool partial) const;

        void flush_indent()
        {
            if (needs_indent)
            {
                raw_os(indent.data(), indent.size());
                needs_indent = false;
            }
        }

        void expand(ast::content_list const& contents)
        {
            for (auto const content : contents)
                ctx->visit(*this, content);
        }

        void visit_within(ast::document const& doc)
        {
            auto const old_ctx = ctx;
            ctx = &doc.ctx;
            expand(doc.contents);
            ctx = old_ctx;
        }

        void expand_on_value(ast::content_list const& contents, value const& val)
        {
            content_scope const curr{scope, &val};
            scope = &curr;
            expand(contents);
            scope = curr.parent;
        }

        std::string render_to_string(std::string_view source, delimiters d, value const* data, ast::location loc);

        std::string call_lambda(lambda const& fn, std::string_view text, delimiters d, ast::location loc)
        {
            auto const render = [&, this](std::string_view source, value const* data)
            {
                return render_to_string(source, d, data, loc);
            };
            return fn(text, render);
        }

        void handle_variable(ast::type tag, value const& val, ast::location loc);

        void handle_section(ast::block const& block, value const& val);

        void operator()(ast::type, ast::text const* text);

        void operator()(ast::type tag, ast::variable const* variable)
        {
            if (auto const val = resolve(variable->key))
                return handle_variable(tag, *val, variable->loc);
            unresolved(variable->key, variable->loc, false);
            if (opts.keep_unresolved)
            {
                flush_indent();
                raw_os("{{ ", 3);
                raw_os(variable->key.data(), variable->key.size());
                raw_os(" }}", 3);
            }
        }

        void operator()(ast::type tag, ast::block const* block)
        {
            auto const val = resolve(block->key);
            if (!val)
                unresolved(block->key, block->loc, false);
            if (tag == ast::type::inversion)
            {
                if (!val || !truthy(*val))
                {
                    auto const guard = enter(block->loc);
                    expand(block->contents);
                }
            }
            else if (val)
                handle_section(*block, *val);
        }

        void operator()(ast::type, ast::partial const* partial);

        void operator()(ast::type, void const*) const {} // never called
    };

    void content_visitor::unresolved(std::string const& key, ast::location loc, bool partial) const
    {
        switch (opts.on_missing_key)
        {
        case missing_key::ignore:
            break;
        case missing_key::warn:
        {
            auto const msg = fmt::format("could not find {} '{}' at line {}, column {}",
                partial ? "partial" : "key", key, loc.line, loc.column);
            if (opts.warn)
                opts.warn(msg);
            else
                fmt::print(stderr, "whisker: {}\n", msg);
            break;
        }
        case missing_key::error:
            if (partial)
                throw missing_partial_error(key, loc.line, loc.column);
            throw missing_key_error(key, loc.line, loc.column);
        }
    }

    std::string content_visitor::render_to_string(std::string_view source, delimiters d, value const* data, ast::location loc)
    {
        auto const guard = enter(loc);
        format const tmpl(source, d);
        std::string out;
        string_sink const sink{out};
        escape_sink<string_sink const> const escaped{sink};
        content_scope const curr{scope, data};
        output_handler const esc = opts.escape_html ? output_handler(escaped) : output_handler(sink);
        content_visitor visitor{tmpl.doc().ctx, data ? curr : *scope, sink, esc, opts, depth};
        visitor.expand(tmpl.doc().contents);
        return out;
    }

    void content_visitor::handle_variable(ast::type tag, value const& val, ast::location loc)
    {
        flush_indent();
        output_handler const os = tag == ast::type::var_raw ? raw_os : escape_os;
        if (auto const fn = std::get_if<lambda>(&val))
        {
            // The result of a variable lambda is not parsed as a template.
            auto const str = call_lambda(*fn, {}, {}, loc);
            os(str.data(), str.size());
        }
        else
            print(val, os);
    }

    void content_visitor::handle_section(ast::block const& block, value const& val)
    {
        auto const guard = enter(block.loc);
        if (auto const fn = std::get_if<lambda>(&val))
        {
            delimiters const d{block.open_delim, block.close_delim};
            auto const result = call_lambda(*fn, block.raw, d, block.loc);
            format const tmpl(result, d);
            visit_within(tmpl.doc());
        }
        else if (auto const list = std::get_if<array>(&val))
        {
            for (auto const& elem : *list)
                expand_on_value(block.contents, elem);
        }
        else if (std::holds_alternative<object>(val))
            expand_on_value(block.contents, val);
        else if (truthy(val))
            expand(block.contents);
    }

    void content_visitor::operator()(ast::type, ast::text const* text)
    {
        auto i = text->data();
        auto const n = text->size();
        assert(n && "empty text shouldn't be in ast");
        if (indent.empty())
        {
            raw_os(i, n);
            return;
        }
        auto const ib = indent.data();
        auto const in = indent.size();
        if (needs_indent)
            raw_os(ib, in);
        auto i0 = i;
        auto const e = i + (n - 1); // Don't flush indent on last newline.
        while (i != e)
        {
            if (*i++ == '\n')
            {
                raw_os(i0, i - i0);
                raw_os(ib, in);
                i0 = i;
            }
        }
        needs_indent = *i++ == '\n';
        raw_os(i0, i - i0);
    }

    void content_visitor::operator()(ast::type, ast::partial const* partial)
    {
        std::optional<std::string> text;
        if (opts.partials)
            text = opts.partials(partial->key);
        if (!text)
            return unresolved(partial->key, partial->loc, true);

        auto const guard = enter(partial->loc);
        // Partials always start with the default delimiters.
        format const tmpl(*text);
        auto const& doc = tmpl.doc();
        if (doc.contents.empty())
            return;
        auto const old_size = indent.size();
        indent += partial->indent;
        needs_indent |= !partial->indent.empty();
        visit_within(doc);
        indent.resize(old_size);
        if (indent.empty())
            needs_indent = false;
    }

    void render(output_handler raw_os, output_handler escape_os, format const& fmt, value const& data, render_options const& opts)
    {
        content_scope const scope{nullptr, &data};
        auto const& doc = fmt.doc();
        content_visitor visitor{doc.ctx, scope, raw_os, escape_os, opts, 0};
        visitor.expand(doc.contents);
    }
}

namespace whisker
{
    missing_key_error::missing_key_error(std::string key, unsigned line, unsigned column)
      : render_error(fmt::format("could not find key '{}' at line {}, column {}", key, line, column), line, column)
      , _key(std::move(key))
    {}

    missing_partial_error::missing_partial_error(std::string key, unsigned line, unsigned column)
      : render_error(fmt::format("could not find partial '{}' at line {}, column {}", key, line, column), line, column)
      , _key(std::move(key))
    {}

    recursion_limit_exceeded::recursion_limit_exceeded(unsigned depth, unsigned line, unsigned column)
      : render_error(fmt::format("recursion limit of {} exceeded at line {}, column {}", depth, line, column), line, column)
      , _depth(depth)
    {}
}
