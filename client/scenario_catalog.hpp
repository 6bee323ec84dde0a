#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "scenario.hpp"

/**
 * @brief Named scenario registry. Resolving an unknown name throws
 * ScenarioNotFound listing the known names.
 */
class ScenarioCatalog {
public:
    using Factory = std::function<std::unique_ptr<IScenario>()>;

    struct Entry {
        std::string name;
        std::string description;
        Factory factory;
    };

    // Every scenario shipped with the harness.
    static ScenarioCatalog Builtin();

    // Throws ConfigurationError on a duplicate name.
    void Register(Factory factory);

    std::unique_ptr<IScenario> Resolve(const std::string& name) const;

    std::vector<std::string> Names() const;
    const std::vector<Entry>& Entries() const { return entries_; }

private:
    std::vector<Entry> entries_;
};
