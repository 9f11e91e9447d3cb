#include <convo/config/Config.hpp>

#include <fstream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace convo::config
{
    Config::Config(const std::string &path)
        : path_(path)
    {
        std::ifstream in(path);
        if (!in)
        {
            throw std::runtime_error("[Config] Cannot open " + path);
        }

        nlohmann::json parsed = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
        if (parsed.is_discarded() || !parsed.is_object())
        {
            throw std::runtime_error("[Config] " + path + " is not a JSON object");
        }

        root_ = std::move(parsed);
    }

    Config::Config(nlohmann::json root)
        : root_(std::move(root))
    {
        if (!root_.is_object())
        {
            root_ = nlohmann::json::object();
        }
    }

    const nlohmann::json *Config::find(const std::string &key) const
    {
        const nlohmann::json *node = &root_;
        std::size_t start = 0;

        while (start <= key.size())
        {
            const std::size_t dot = key.find('.', start);
            const std::string part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);

            if (!node->is_object())
                return nullptr;

            auto it = node->find(part);
            if (it == node->end())
                return nullptr;

            node = &(*it);

            if (dot == std::string::npos)
                break;
            start = dot + 1;
        }

        return node;
    }

    bool Config::has(const std::string &key) const
    {
        return find(key) != nullptr;
    }

    int Config::getInt(const std::string &key, int defaultValue) const
    {
        const auto *node = find(key);
        if (!node || !node->is_number_integer())
            return defaultValue;

        const auto v = node->get<long long>();
        if (v > std::numeric_limits<int>::max() || v < std::numeric_limits<int>::min())
            return defaultValue;
        return static_cast<int>(v);
    }

    bool Config::getBool(const std::string &key, bool defaultValue) const
    {
        const auto *node = find(key);
        if (!node || !node->is_boolean())
            return defaultValue;
        return node->get<bool>();
    }

    std::string Config::getString(const std::string &key, const std::string &defaultValue) const
    {
        const auto *node = find(key);
        if (!node || !node->is_string())
            return defaultValue;
        return node->get<std::string>();
    }

} // namespace convo::config
