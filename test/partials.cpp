/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#include <catch2/catch.hpp>
#include <map>
#include "model.hpp"

using namespace whisker;
using namespace test;

TEST_CASE("partial-lookup")
{
    object const data{{"text", "content"}};
    context const partials
    {
        {"plain", "from partial"},
        {"ctx", "*{{text}}*"},
        {"table_flip", "(╯°□°）╯︵ ┻━┻"}
    };

    CHECK(to_string("\"{{>plain}}\""_fmt(data).partials(partials)) == "\"from partial\"");
    CHECK(to_string("\"{{>ctx}}\""_fmt(data).partials(partials)) == "\"*content*\"");
    CHECK(to_string("{{> table_flip }}"_fmt(data).partials(partials)) == "(╯°□°）╯︵ ┻━┻");
    CHECK(to_string("|{{> plain }}|"_fmt(data).partials(partials)) == "|from partial|");
}

TEST_CASE("partial-map-source")
{
    std::map<std::string, std::string> const templates{{"greet", "hi {{name}}"}};
    render_options opts;
    opts.partials = map_partials(templates);
    CHECK(render("{{>greet}}!", object{{"name", "Ann"}}, opts) == "hi Ann!");
    CHECK(render("{{>other}}!", object{}, opts) == "!");
}

TEST_CASE("partial-recursion")
{
    object const data
    {
        {"content", "X"},
        {"nodes", array{object{{"content", "Y"}, {"nodes", array{}}}}}
    };
    context const partials{{"node", "{{content}}<{{#nodes}}{{>node}}{{/nodes}}>"}};
    CHECK(to_string("{{>node}}"_fmt(data).partials(partials)) == "X<Y<>>");

    context const forever{{"self", "x{{>self}}"}};
    render_options opts;
    opts.partials = forever;
    opts.max_depth = 32;
    CHECK_THROWS_AS(render("{{>self}}", object{}, opts), recursion_limit_exceeded);
}

TEST_CASE("partial-delimiters-reset")
{
    object const data{{"value", "yes"}, {"x", 1}};
    context const partials
    {
        {"include", ".{{value}}. {{= | | =}} .|value|."},
        {"plain", "{{x}}"}
    };

    CHECK(to_string("{{=<% %>=}}<%> plain %>"_fmt(data).partials(partials)) == "1");
    CHECK(to_string("[ {{>include}} ]\n{{= | | =}}\n[ |>include| ]\n"_fmt(data).partials(partials))
        == "[ .yes.  .yes. ]\n[ .yes.  .yes. ]\n");
}

TEST_CASE("partial-whitespace")
{
    context const partials
    {
        {"tab", "\t|\t"},
        {"two", ">\n>"},
        {"one", ">"}
    };

    SECTION("surrounding")
    {
        CHECK(to_string("| {{>tab}} |"_fmt(object{}).partials(partials)) == "| \t|\t |");
    }

    SECTION("inline indentation")
    {
        CHECK(to_string("  {{data}}  {{> two}}\n"_fmt(object{{"data", "|"}}).partials(partials)) == "  |  >\n>\n");
    }

    SECTION("standalone line endings")
    {
        CHECK(to_string("|\r\n{{>one}}\r\n|"_fmt(object{}).partials(partials)) == "|\r\n>|");
    }

    SECTION("standalone without previous line")
    {
        CHECK(to_string("  {{>two}}\n>"_fmt(object{}).partials(partials)) == "  >\n  >>");
    }

    SECTION("standalone without newline")
    {
        CHECK(to_string(">\n  {{>two}}"_fmt(object{}).partials(partials)) == ">\n  >\n  >");
    }
}

TEST_CASE("partial-indentation")
{
    SECTION("lines of the partial")
    {
        context const partials{{"partial", "|\n{{{content}}}\n|\n"}};
        object const data{{"content", "<\n->"}};
        CHECK(to_string("\\\n {{>partial}}\n/\n"_fmt(data).partials(partials)) == "\\\n |\n <\n->\n |\n/\n");
    }

    SECTION("tabs")
    {
        context const partials{{"count", "\tone\n\ttwo"}};
        CHECK(to_string("\t{{> count }}"_fmt(object{}).partials(partials)) == "\t\tone\n\t\ttwo");
    }

    SECTION("nested partials with sections")
    {
        context const partials
        {
            {"count", "    {{> iter_scope }}"},
            {"iter_scope", "foobar\n{{#thing}}\n {{.}}\n{{/thing}}"}
        };
        object const data{{"thing", array{"foo", "bar", "baz"}}};
        CHECK(to_string("{{> count }}"_fmt(data).partials(partials)) == "    foobar\n     foo\n     bar\n     baz\n");
    }
}

TEST_CASE("partial-missing")
{
    format const fmt("before {{>p}} after");

    SECTION("ignore")
    {
        CHECK(to_string(fmt(object{})) == "before  after");
        CHECK(to_string(fmt(object{}).partials(context{})) == "before  after");
    }

    SECTION("warn")
    {
        warnings log;
        render_options opts;
        opts.on_missing_key = missing_key::warn;
        opts.warn = log.handler();
        std::string out;
        render_string(out, fmt, object{}, opts);
        CHECK(out == "before  after");
        REQUIRE(log.size() == 1);
        CHECK(log[0] == "could not find partial 'p' at line 1, column 8");
    }

    SECTION("error")
    {
        try
        {
            to_string(fmt(object{}).on_missing(missing_key::error));
            FAIL("expected missing_partial_error");
        }
        catch (missing_partial_error const& e)
        {
            CHECK(e.key() == "p");
            CHECK(e.line() == 1);
            CHECK(e.column() == 8);
        }
    }
}

TEST_CASE("partial-syntax-error")
{
    context const partials{{"broken", "{{#open}}"}};
    CHECK_THROWS_AS(to_string("{{>broken}}"_fmt(object{}).partials(partials)), syntax_error);
}
