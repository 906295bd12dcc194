#ifndef FURNILYTICS_ENVIRONMENT_HPP
#define FURNILYTICS_ENVIRONMENT_HPP

#include <map>
#include <optional>
#include <string>

namespace furnilytics::config {
    class IEnvironment {
       public:
        IEnvironment() = default;
        virtual ~IEnvironment() = default;
        IEnvironment(const IEnvironment&) = delete;
        IEnvironment& operator=(const IEnvironment&) = delete;
        IEnvironment(IEnvironment&&) = delete;
        IEnvironment& operator=(IEnvironment&&) = delete;

        [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) const = 0;
    };

    class ProcessEnvironment : public IEnvironment {
       public:
        [[nodiscard]] std::optional<std::string> get(const std::string& key) const override;
    };

    class MapEnvironment : public IEnvironment {
       public:
        MapEnvironment() = default;
        explicit MapEnvironment(std::map<std::string, std::string> values);

        [[nodiscard]] std::optional<std::string> get(const std::string& key) const override;

       private:
        std::map<std::string, std::string> values_;
    };
}  // namespace furnilytics::config

#endif
