#pragma once

#include <random>
#include <stdexcept>
#include <vector>

template <typename T>
struct Weighted {
    double weight;
    T value;
};

/**
 * @brief Picks one entry with probability proportional to its weight.
 * @throws std::invalid_argument if there is nothing to choose from.
 */
template <typename T>
const T& pick_weighted(const std::vector<Weighted<T>>& choices, std::mt19937& gen)
{
    if (choices.empty()) {
        throw std::invalid_argument("pick_weighted: no choices");
    }

    double total = 0.0;
    for (const auto& c : choices) {
        if (c.weight < 0.0) {
            throw std::invalid_argument("pick_weighted: negative weight");
        }
        total += c.weight;
    }
    if (total <= 0.0) {
        throw std::invalid_argument("pick_weighted: all weights are zero");
    }

    std::uniform_real_distribution<double> dist(0.0, total);
    double roll = dist(gen);
    for (const auto& c : choices) {
        if (roll < c.weight) return c.value;
        roll -= c.weight;
    }
    // Rounding at the upper edge lands on the last non-empty choice
    for (auto it = choices.rbegin(); it != choices.rend(); ++it) {
        if (it->weight > 0.0) return it->value;
    }
    return choices.back().value;
}

// Equal weights.
template <typename T>
std::vector<Weighted<T>> uniformly(std::vector<T> values)
{
    std::vector<Weighted<T>> out;
    out.reserve(values.size());
    for (auto& v : values) {
        out.push_back(Weighted<T>{1.0, std::move(v)});
    }
    return out;
}
