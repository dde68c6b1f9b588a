#include <algorithm>
#include <memory>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "fake_random.h"
#include "h/char_pools.h"
#include "h/exceptions.h"
#include "h/pass_gen.h"
#include "gtest/gtest.h"

namespace {

bool contains(const char* pool, char c) {
    return std::string(pool).find(c) != std::string::npos;
}

// Every character comes from an enabled pool, and when the password is long
// enough every enabled pool shows up at least once.
void CheckPasswordClasses(const std::string& password, bool symbols, bool digits,
                          bool upper, bool lower) {
    bool has_symbol = false;
    bool has_digit = false;
    bool has_upper = false;
    bool has_lower = false;
    for (char c : password) {
        has_symbol = has_symbol || contains(CharPools::SYMBOLS, c);
        has_digit = has_digit || contains(CharPools::DIGITS, c);
        has_upper = has_upper || contains(CharPools::UPPERCASE, c);
        has_lower = has_lower || contains(CharPools::LOWERCASE, c);
    }
    const std::size_t enabled = symbols + digits + upper + lower;
    if (password.size() >= enabled) {
        EXPECT_EQ(symbols, has_symbol) << password;
        EXPECT_EQ(digits, has_digit) << password;
        EXPECT_EQ(upper, has_upper) << password;
        EXPECT_EQ(lower, has_lower) << password;
    } else {
        EXPECT_TRUE(symbols || !has_symbol) << password;
        EXPECT_TRUE(digits || !has_digit) << password;
        EXPECT_TRUE(upper || !has_upper) << password;
        EXPECT_TRUE(lower || !has_lower) << password;
    }
}

std::unique_ptr<PasswordGenerator> MakeFixedGenerator(bool coin, FixedRandom::Index index,
                                                      PasswordGenerator::ShuffleMode mode) {
    return std::make_unique<PasswordGenerator>(std::make_unique<FixedRandom>(coin, index), mode);
}

}  // namespace

TEST(PasswordGeneratorTest, GeneratesEveryLength) {
    PasswordGenerator generator;
    for (int length = 0; length <= 255; ++length) {
        std::string password = generator.generatePassword(length, true, true, true, true);
        EXPECT_EQ(static_cast<std::size_t>(length), password.size());
    }
}

TEST(PasswordGeneratorTest, ZeroLengthIsEmpty) {
    PasswordGenerator generator;
    EXPECT_EQ("", generator.generatePassword(0, true, true, true, true));
    EXPECT_EQ("", generator.generatePassword(0, false, false, false, false));
}

TEST(PasswordGeneratorTest, Pin) {
    PasswordGenerator generator;
    std::string password = generator.generatePassword(5, false, true, false, false);
    ASSERT_EQ(5u, password.size());
    for (char c : password) {
        EXPECT_TRUE(contains(CharPools::DIGITS, c)) << password;
    }
}

TEST(PasswordGeneratorTest, EveryClassCombination) {
    PasswordGenerator generator;
    for (int mask = 1; mask < 16; ++mask) {
        const bool symbols = mask & 1;
        const bool digits = mask & 2;
        const bool upper = mask & 4;
        const bool lower = mask & 8;
        for (int length : {1, 2, 3, 4, 10, 64, 255}) {
            std::string password = generator.generatePassword(length, symbols, digits, upper, lower);
            ASSERT_EQ(static_cast<std::size_t>(length), password.size());
            CheckPasswordClasses(password, symbols, digits, upper, lower);
        }
    }
}

TEST(PasswordGeneratorTest, UniformShuffleKeepsClasses) {
    PasswordGenerator generator(PasswordGenerator::ShuffleMode::Uniform);
    EXPECT_EQ(PasswordGenerator::ShuffleMode::Uniform, generator.shuffleMode());
    for (int mask = 1; mask < 16; ++mask) {
        std::string password = generator.generatePassword(20, mask & 1, mask & 2, mask & 4, mask & 8);
        ASSERT_EQ(20u, password.size());
        CheckPasswordClasses(password, mask & 1, mask & 2, mask & 4, mask & 8);
    }
}

TEST(PasswordGeneratorTest, NoClassEnabledThrows) {
    PasswordGenerator generator;
    EXPECT_THROW(generator.generatePassword(10, false, false, false, false), NoClassEnabledError);
    EXPECT_THROW(generator.generatePassword(1, false, false, false, false), NoClassEnabledError);
}

TEST(PasswordGeneratorTest, InvalidLengthThrows) {
    PasswordGenerator generator;
    EXPECT_THROW(generator.generatePassword(-1, true, true, true, true), InvalidLengthError);
    EXPECT_THROW(generator.generatePassword(256, true, true, true, true), InvalidLengthError);
}

TEST(PasswordGeneratorTest, NullRandomSourceThrows) {
    std::unique_ptr<RandomSource> missing;
    EXPECT_THROW(PasswordGenerator generator(std::move(missing), PasswordGenerator::ShuffleMode::FrontBack),
                 std::invalid_argument);
}

TEST(PasswordGeneratorTest, DistributeRoundRobin) {
    std::vector<CharRule> expected = {
        CharRule::Symbol, CharRule::Digit, CharRule::Lower, CharRule::Upper,
        CharRule::Symbol, CharRule::Digit, CharRule::Lower};
    EXPECT_EQ(expected, PasswordGenerator::distributeRules(7, true, true, true, true));

    expected = {CharRule::Digit, CharRule::Upper, CharRule::Digit};
    EXPECT_EQ(expected, PasswordGenerator::distributeRules(3, false, true, true, false));

    EXPECT_TRUE(PasswordGenerator::distributeRules(5, false, false, false, false).empty());
    EXPECT_TRUE(PasswordGenerator::distributeRules(0, true, true, true, true).empty());
}

TEST(PasswordGeneratorTest, DistributeIsBalanced) {
    for (int length = 0; length <= 255; length += 17) {
        std::vector<CharRule> rules = PasswordGenerator::distributeRules(length, true, true, false, true);
        ASSERT_EQ(static_cast<std::size_t>(length), rules.size());
        for (CharRule rule : {CharRule::Symbol, CharRule::Digit, CharRule::Lower}) {
            const long count = std::count(rules.begin(), rules.end(), rule);
            EXPECT_GE(count, length / 3);
            EXPECT_LE(count, (length + 2) / 3);
        }
        EXPECT_EQ(0, std::count(rules.begin(), rules.end(), CharRule::Upper));
    }
}

TEST(PasswordGeneratorTest, FrontBackPlacement) {
    // Distributed order is S D L U S D, the first character of each pool fills it
    auto back = MakeFixedGenerator(false, FixedRandom::Index::First, PasswordGenerator::ShuffleMode::FrontBack);
    EXPECT_EQ("!0aA!0", back->generatePassword(6, true, true, true, true));

    auto front = MakeFixedGenerator(true, FixedRandom::Index::First, PasswordGenerator::ShuffleMode::FrontBack);
    EXPECT_EQ("0!Aa0!", front->generatePassword(6, true, true, true, true));
}

TEST(PasswordGeneratorTest, FillDrawsFromMatchingPool) {
    auto generator = MakeFixedGenerator(false, FixedRandom::Index::Last, PasswordGenerator::ShuffleMode::FrontBack);
    EXPECT_EQ("~9zZ", generator->generatePassword(4, true, true, true, true));
}

TEST(PasswordGeneratorTest, UniformShufflePermutes) {
    // Fisher-Yates with every draw at 0 turns S D L into D L S
    auto generator = MakeFixedGenerator(false, FixedRandom::Index::First, PasswordGenerator::ShuffleMode::Uniform);
    EXPECT_EQ("0a!", generator->generatePassword(3, true, true, false, true));
}

TEST(PasswordGeneratorTest, RandomnessUsedPerCharacter) {
    auto owned = std::make_unique<FixedRandom>(false, FixedRandom::Index::First);
    FixedRandom* source = owned.get();
    PasswordGenerator generator(std::move(owned), PasswordGenerator::ShuffleMode::FrontBack);

    generator.generatePassword(0, true, true, true, true);
    EXPECT_EQ(0u, source->coin_calls);
    EXPECT_EQ(0u, source->index_calls);

    generator.generatePassword(12, true, false, true, false);
    EXPECT_EQ(12u, source->coin_calls);
    EXPECT_EQ(12u, source->index_calls);
}

TEST(PasswordGeneratorTest, UniquePasswords) {
    PasswordGenerator generator;
    std::unordered_set<std::string> previously_generated;
    for (int i = 0; i < 100000; ++i) {
        std::string password = generator.generatePassword(10, true, true, true, false);
        ASSERT_EQ(10u, password.size());
        EXPECT_TRUE(previously_generated.insert(password).second)
            << "The password has already been generated: " << password;
    }
}
