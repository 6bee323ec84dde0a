#pragma once

#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Malformed schedule, threshold, option or scenario name.
 * Always raised before any VU starts.
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief An unknown scenario name. Carries the names the catalog knows.
 */
class ScenarioNotFound : public ConfigurationError {
public:
    ScenarioNotFound(const std::string& name, std::vector<std::string> known)
        : ConfigurationError(make_message(name, known)), known_(std::move(known)) {}

    const std::vector<std::string>& known() const { return known_; }

private:
    static std::string make_message(const std::string& name, const std::vector<std::string>& known) {
        std::string msg = "Test '" + name + "' not found. Available tests:";
        for (const auto& n : known) {
            msg += " " + n;
        }
        return msg;
    }

    std::vector<std::string> known_;
};

/**
 * @brief The target service did not become ready.
 */
class EnvironmentUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
