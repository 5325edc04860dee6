/**
 * @file RandomSource.hpp
 * @brief Injectable source of randomness for stylistic phrase selection.
 */

#pragma once

#include <cstddef>
#include <mutex>
#include <random>

namespace sunflower::domain {

/**
 * @class RandomSource
 * @brief Picks an index in [0, count). Tests pin it to stay reproducible.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /** @brief Returns an index below count; count must be positive. */
    virtual std::size_t pick(std::size_t count) = 0;
};

/**
 * @class FirstChoiceSource
 * @brief Always picks the first phrasing. Default for deterministic output.
 */
class FirstChoiceSource : public RandomSource {
public:
    std::size_t pick(std::size_t) override { return 0; }
};

/**
 * @class SeededRandomSource
 * @brief Mersenne Twister backed source, safe to share across worker threads.
 */
class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(unsigned int seed) : m_engine(seed) {}

    std::size_t pick(std::size_t count) override {
        if (count <= 1) return 0;
        std::lock_guard<std::mutex> lock(m_mutex);
        std::uniform_int_distribution<std::size_t> dist(0, count - 1);
        return dist(m_engine);
    }

private:
    std::mt19937 m_engine;
    std::mutex m_mutex;
};

} // namespace sunflower::domain
