#include "lgs_platform.hpp"
#include "spray/line_generator.hpp"

#include <chrono>
#include <exception>

namespace logspray::spray
{

namespace
{
uint64_t entropy_seed()
{
    try
    {
        // entropy() reports 0 on some standard libraries even for a real device.
        std::random_device rd;
        const uint64_t high = rd();
        return (high << 32U) | rd();
    }
    catch (const std::exception &)
    {
        // No usable device; fall through to the clock hash.
    }
    const auto ns = static_cast<uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    // Knuth multiplicative hash; the pid separates workers started in the same tick.
    return ((ns ^ (ns >> 17U)) * 2654435761ULL) ^ (platform::get_pid() << 32U);
}
} // namespace

LineGenerator::LineGenerator() : m_engine(entropy_seed()) {}

LineGenerator::LineGenerator(uint64_t seed) : m_engine(seed) {}

std::string LineGenerator::next(int length)
{
    if (length <= 0)
    {
        return {};
    }
    std::string line(static_cast<size_t>(length), '\0');
    for (auto &c : line)
    {
        c = kLineAlphabet[m_pick(m_engine)];
    }
    return line;
}

std::string make_random_line(int length)
{
    thread_local LineGenerator generator;
    return generator.next(length);
}

} // namespace logspray::spray
