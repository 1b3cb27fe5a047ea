/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2017-2024 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#include <catch2/catch.hpp>
#include "model.hpp"

using namespace whisker;
using namespace test;

TEST_CASE("unresolved")
{
    format const fmt("before-{{unresolved}}-after");
    object const empty;
    std::string out;

    SECTION("throw")
    {
        render_options opts;
        opts.on_missing_key = missing_key::error;
        CHECK_THROWS_WITH
        (
            render_string(out, fmt, empty, opts),
            "could not find key 'unresolved' at line 1, column 8"
        );

        CHECK(out == "before-");
    }

    SECTION("keep")
    {
        render_options opts;
        opts.keep_unresolved = true;
        render_string(out, fmt, empty, opts);

        CHECK(out == "before-{{ unresolved }}-after");
    }

    SECTION("warn and keep")
    {
        warnings log;
        render_options opts;
        opts.on_missing_key = missing_key::warn;
        opts.keep_unresolved = true;
        opts.warn = log.handler();
        render_string(out, fmt, empty, opts);

        CHECK(out == "before-{{ unresolved }}-after");
        CHECK(log.size() == 1);
    }

    SECTION("error wins over keep")
    {
        render_options opts;
        opts.on_missing_key = missing_key::error;
        opts.keep_unresolved = true;
        CHECK_THROWS_AS(render_string(out, fmt, empty, opts), missing_key_error);
    }
}

TEST_CASE("nested")
{
    format const fmt("{{a.b}}");
    constexpr auto void_sink = [](char const*, std::size_t) {};
    render_options opts;
    opts.on_missing_key = missing_key::error;

    try
    {
        render(void_sink, fmt, object{}, opts);
        FAIL("expected missing_key_error");
    }
    catch (missing_key_error const& e)
    {
        CHECK(e.key() == "a.b");
    }

    try
    {
        render(void_sink, fmt, object{{"a", object{}}}, opts);
        FAIL("expected missing_key_error");
    }
    catch (missing_key_error const& e)
    {
        CHECK(e.key() == "a.b");
    }

    CHECK_NOTHROW(render(void_sink, fmt, object{{"a", object{{"b", nullptr}}}}, opts));
}

TEST_CASE("resolved-in-outer-frame")
{
    warnings log;
    render_options opts;
    opts.on_missing_key = missing_key::warn;
    opts.warn = log.handler();

    object const data{{"list", array{object{}, object{{"x", "inner"}}}}, {"x", "outer"}};
    CHECK(render("{{#list}}{{x}},{{/list}}", data, opts) == "outer,inner,");
    CHECK(log.empty());
}
