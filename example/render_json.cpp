/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2016-2024 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#include <iostream>
#include <filesystem>
#include <boost/iostreams/device/mapped_file.hpp>
#include <nlohmann/json.hpp>
#include <whisker/render/ostream.hpp>

// Usage: whisker_render_json [--strict|--warn] [--keep] [--no-escape] <template> [data.json]
// Partials are looked up as <name>.mustache beside the template.

static std::string read_file(std::filesystem::path const& path)
{
    // Mapping an empty file fails.
    if (std::filesystem::file_size(path) == 0)
        return {};
    boost::iostreams::mapped_file_source file(path.string());
    return std::string(file.data(), file.size());
}

static whisker::value to_value(nlohmann::json const& json)
{
    switch (json.type())
    {
    case nlohmann::json::value_t::boolean:
        return json.get<bool>();
    case nlohmann::json::value_t::number_integer:
        return json.get<std::int64_t>();
    case nlohmann::json::value_t::number_unsigned:
        return json.get<std::uint64_t>();
    case nlohmann::json::value_t::number_float:
        return json.get<double>();
    case nlohmann::json::value_t::string:
        return json.get_ref<nlohmann::json::string_t const&>();
    case nlohmann::json::value_t::array:
    {
        whisker::array ret;
        ret.reserve(json.size());
        for (auto const& elem : json)
            ret.push_back(to_value(elem));
        return ret;
    }
    case nlohmann::json::value_t::object:
    {
        whisker::object ret;
        ret.reserve(json.size());
        for (auto const& [key, elem] : json.items())
            ret.emplace_back(key, to_value(elem));
        return ret;
    }
    default:
        return nullptr;
    }
}

int main(int argc, char** argv)
{
    whisker::render_options opts;
    std::vector<std::string_view> args;
    for (int i = 1; i != argc; ++i)
    {
        std::string_view const arg(argv[i]);
        if (arg == "--strict")
            opts.on_missing_key = whisker::missing_key::error;
        else if (arg == "--warn")
            opts.on_missing_key = whisker::missing_key::warn;
        else if (arg == "--keep")
            opts.keep_unresolved = true;
        else if (arg == "--no-escape")
            opts.escape_html = false;
        else
            args.push_back(arg);
    }
    if (args.empty() || args.size() > 2)
    {
        std::cerr << "usage: " << argv[0] << " [--strict|--warn] [--keep] [--no-escape] <template> [data.json]\n";
        return 2;
    }

    try
    {
        std::filesystem::path const tmpl(args[0]);
        auto const dir = tmpl.parent_path();
        opts.partials = [&dir](std::string const& name) -> std::optional<std::string>
        {
            auto const path = dir / (name + ".mustache");
            if (!std::filesystem::is_regular_file(path))
                return std::nullopt;
            return read_file(path);
        };
        opts.warn = [](std::string const& msg)
        {
            std::cerr << "warning: " << msg << '\n';
        };

        whisker::value data = whisker::object{};
        if (args.size() == 2)
            data = to_value(nlohmann::json::parse(read_file(std::filesystem::path(args[1]))));

        whisker::format const fmt(read_file(tmpl));
        std::cout << fmt(data).options(opts);
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << '\n';
        return 1;
    }
}
