#include "scenario_catalog.hpp"

#include "errors.hpp"
#include "scenarios/basic_load_scenario.hpp"
#include "scenarios/error_scenario.hpp"
#include "scenarios/profiling_scenario.hpp"
#include "scenarios/soak_scenario.hpp"
#include "scenarios/spike_scenario.hpp"
#include "scenarios/stress_scenario.hpp"

template <typename T>
static std::unique_ptr<IScenario> make_scenario()
{
    return std::make_unique<T>();
}

ScenarioCatalog ScenarioCatalog::Builtin()
{
    ScenarioCatalog catalog;
    catalog.Register(make_scenario<BasicLoadScenario>);
    catalog.Register(make_scenario<StressScenario>);
    catalog.Register(make_scenario<SpikeScenario>);
    catalog.Register(make_scenario<SoakScenario>);
    catalog.Register(make_scenario<ErrorScenario>);
    catalog.Register(make_scenario<ProfilingScenario>);
    return catalog;
}

void ScenarioCatalog::Register(Factory factory)
{
    auto sample = factory();
    if (!sample) {
        throw ConfigurationError("Scenario factory returned nothing");
    }

    std::string name = sample->name();
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            throw ConfigurationError("Scenario '" + name + "' registered twice");
        }
    }
    entries_.push_back(Entry{name, sample->description(), std::move(factory)});
}

std::unique_ptr<IScenario> ScenarioCatalog::Resolve(const std::string& name) const
{
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return entry.factory();
        }
    }
    throw ScenarioNotFound(name, Names());
}

std::vector<std::string> ScenarioCatalog::Names() const
{
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.name);
    }
    return names;
}
