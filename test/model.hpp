#include <unordered_map>
#include <vector>
#include <whisker/render/string.hpp>

namespace test
{
    // Partial templates by name, usable directly as a partial_source.
    struct context : std::unordered_map<std::string, std::string>
    {
        using unordered_map::unordered_map;

        std::optional<std::string> operator()(std::string const& key) const
        {
            auto it = find(key);
            if (it == end())
                return std::nullopt;
            return it->second;
        }
    };

    struct warnings : std::vector<std::string>
    {
        whisker::warning_handler handler()
        {
            return [this](std::string const& msg) { push_back(msg); };
        }
    };
}
