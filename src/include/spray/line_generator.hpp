#pragma once
/**
 * @file line_generator.hpp
 * @brief Random fixed-length alphanumeric lines used as log payloads.
 *
 * Every character is drawn independently and uniformly, with replacement, from
 * the 36 symbols `A-Z0-9`. A `LineGenerator` owns its engine; each worker
 * process builds its own, so no random state is shared between workers.
 */
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

namespace logspray::spray
{

inline constexpr std::string_view kLineAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

/// Length of every line emitted by the command line tool.
inline constexpr int kDefaultLineLength = 100;

/// True if `c` is one of the 36 characters a line can contain.
constexpr bool is_line_symbol(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

class LineGenerator
{
  public:
    /// Seeds from std::random_device, or from a clock and pid hash when the device
    /// reports no entropy.
    LineGenerator();

    /// Fixed seed; the same seed yields the same sequence of lines.
    explicit LineGenerator(uint64_t seed);

    /// Returns exactly `length` symbols from kLineAlphabet, or "" when `length <= 0`.
    std::string next(int length);

  private:
    std::mt19937_64 m_engine;
    std::uniform_int_distribution<size_t> m_pick{0, kLineAlphabet.size() - 1};
};

/// Convenience wrapper over a thread-local LineGenerator.
std::string make_random_line(int length);

} // namespace logspray::spray
