#ifndef CONVO_CONFIG_CONFIG_HPP
#define CONVO_CONFIG_CONFIG_HPP

/**
 * @file Config.hpp
 * @brief JSON-file backed configuration with dotted-key lookup.
 *
 * @details
 * Keys address nested objects with dots, e.g. `server.port` reads
 * `{"server": {"port": 9090}}`. Lookups never throw: a missing key or a
 * value of the wrong type yields the supplied default.
 */

#include <string>

#include <nlohmann/json.hpp>

namespace convo::config
{
    class Config
    {
    public:
        /// Empty configuration: every lookup returns its default.
        Config() = default;

        /// Load from a JSON file. Throws std::runtime_error when the file is
        /// unreadable or does not contain a JSON object.
        explicit Config(const std::string &path);

        explicit Config(nlohmann::json root);

        [[nodiscard]] bool has(const std::string &key) const;

        [[nodiscard]] int getInt(const std::string &key, int defaultValue) const;
        [[nodiscard]] bool getBool(const std::string &key, bool defaultValue) const;
        [[nodiscard]] std::string getString(const std::string &key,
                                            const std::string &defaultValue) const;

        [[nodiscard]] const std::string &path() const noexcept { return path_; }

    private:
        const nlohmann::json *find(const std::string &key) const;

        std::string path_;
        nlohmann::json root_ = nlohmann::json::object();
    };

} // namespace convo::config

#endif // CONVO_CONFIG_CONFIG_HPP
