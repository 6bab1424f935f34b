/**
 * @file test_line_generator.cpp
 * @brief Tests for random line generation.
 */
#include "lgs_spray.hpp"
#include "test_patterns.h"

#include <algorithm>
#include <map>
#include <set>
#include <string>

#include <gtest/gtest.h>

using namespace logspray::spray;

class LineGeneratorTest : public logspray::tests::PureApiTest
{
};

TEST_F(LineGeneratorTest, ProducesRequestedLength)
{
    LineGenerator gen;
    EXPECT_EQ(gen.next(1).size(), 1u);
    EXPECT_EQ(gen.next(7).size(), 7u);
    EXPECT_EQ(gen.next(kDefaultLineLength).size(), 100u);
    EXPECT_EQ(gen.next(4096).size(), 4096u);
}

TEST_F(LineGeneratorTest, NonPositiveLengthYieldsEmptyLine)
{
    LineGenerator gen;
    EXPECT_EQ(gen.next(0), "");
    EXPECT_EQ(gen.next(-1), "");
    EXPECT_EQ(make_random_line(-100), "");
}

TEST_F(LineGeneratorTest, UsesOnlyUppercaseLettersAndDigits)
{
    LineGenerator gen;
    for (int i = 0; i < 100; ++i)
    {
        const auto line = gen.next(kDefaultLineLength);
        EXPECT_TRUE(std::all_of(line.begin(), line.end(), is_line_symbol)) << line;
    }
}

TEST_F(LineGeneratorTest, CoversWholeAlphabet)
{
    LineGenerator gen(42);
    const auto line = gen.next(20000);
    std::set<char> seen(line.begin(), line.end());
    EXPECT_EQ(seen.size(), kLineAlphabet.size());
}

TEST_F(LineGeneratorTest, AlphabetMatchesSymbolPredicate)
{
    EXPECT_EQ(kLineAlphabet.size(), 36u);
    for (char c : kLineAlphabet)
        EXPECT_TRUE(is_line_symbol(c)) << c;
    EXPECT_FALSE(is_line_symbol('a'));
    EXPECT_FALSE(is_line_symbol(' '));
    EXPECT_FALSE(is_line_symbol(':'));
}

TEST_F(LineGeneratorTest, SameSeedGivesSameSequence)
{
    LineGenerator a(1234);
    LineGenerator b(1234);
    for (int i = 0; i < 10; ++i)
        EXPECT_EQ(a.next(32), b.next(32));
}

TEST_F(LineGeneratorTest, DifferentSeedsDiverge)
{
    LineGenerator a(1);
    LineGenerator b(2);
    EXPECT_NE(a.next(kDefaultLineLength), b.next(kDefaultLineLength));
}

TEST_F(LineGeneratorTest, SymbolFrequenciesAreUniform)
{
    // 36000 draws over 36 symbols: 1000 expected per symbol, allow 20%.
    LineGenerator gen(7);
    const auto line = gen.next(36000);
    std::map<char, int> counts;
    for (char c : line)
        ++counts[c];
    ASSERT_EQ(counts.size(), kLineAlphabet.size());
    for (const auto &[symbol, count] : counts)
    {
        EXPECT_GE(count, 800) << symbol;
        EXPECT_LE(count, 1200) << symbol;
    }
}

TEST_F(LineGeneratorTest, DefaultSeededGeneratorsDiverge)
{
    LineGenerator a;
    LineGenerator b;
    EXPECT_NE(a.next(kDefaultLineLength), b.next(kDefaultLineLength));
}

TEST_F(LineGeneratorTest, SuccessiveLinesDiffer)
{
    std::set<std::string> lines;
    for (int i = 0; i < 50; ++i)
        lines.insert(make_random_line(kDefaultLineLength));
    EXPECT_EQ(lines.size(), 50u);
}
