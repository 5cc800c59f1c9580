#ifndef PIIGUARD_TEST_UNIT_TEST_SYNTHETIC_HPP
#define PIIGUARD_TEST_UNIT_TEST_SYNTHETIC_HPP

#include <gtest/gtest.h>
#include <regex>
#include <string>

#include "core/category.hpp"
#include "synthetic/synthetic_cache.hpp"
#include "synthetic/synthetic_generator.hpp"
#include "util/hashing.hpp"

TEST(HashingTest, Sha256KnownVector) {
    EXPECT_EQ(piiguard::util::hashing::sha256(std::string("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SyntheticGeneratorTest, ShapesPerCategory) {
    using piiguard::core::Category;
    piiguard::synthetic::FakeDataGenerator gen(1234);
    ASSERT_TRUE(gen.isAvailable());

    const std::regex emailShape(R"([a-z]+\.[a-z]+(\d\d)?@(gmail|yahoo|hotmail)\.com)");
    const std::regex phoneShape(R"(\(\d{3}\) \d{3}-\d{4}|\+1-\d{3}-\d{3}-\d{4}|\d{3}\.\d{3}\.\d{4})");
    for (int i = 0; i < 50; ++i) {
        std::string email = gen.generate(Category::EMAIL);
        EXPECT_TRUE(std::regex_match(email, emailShape)) << email;
        std::string phone = gen.generate(Category::PHONE);
        EXPECT_TRUE(std::regex_match(phone, phoneShape)) << phone;
    }
    EXPECT_NE(gen.generate(Category::PERSON).find(' '), std::string::npos);
    EXPECT_FALSE(gen.generate(Category::GPE).empty());
    EXPECT_FALSE(gen.generate(Category::ORGANIZATION).empty());
    // no generator for these
    EXPECT_EQ(gen.generate(Category::IP), "[REDACTED_IP]");
    EXPECT_EQ(gen.generate(Category::JWT), "[REDACTED_JWT]");
}

TEST(SyntheticGeneratorTest, SameSeedSameSequence) {
    using piiguard::core::Category;
    piiguard::synthetic::FakeDataGenerator a(99);
    piiguard::synthetic::FakeDataGenerator b(99);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(a.generate(Category::EMAIL), b.generate(Category::EMAIL));
    }
}

TEST(SyntheticGeneratorTest, DisabledResolvesUnavailable) {
    auto gen = piiguard::synthetic::makeSyntheticGenerator(false, 0);
    EXPECT_FALSE(gen->isAvailable());
    EXPECT_EQ(gen->generate(piiguard::core::Category::EMAIL), "[REDACTED_EMAIL]");

    auto seeded = piiguard::synthetic::makeSyntheticGenerator(true, 5);
    EXPECT_TRUE(seeded->isAvailable());
}

TEST(SyntheticCacheTest, SameOriginalSameReplacement) {
    using piiguard::core::Category;
    piiguard::synthetic::FakeDataGenerator gen(42);
    piiguard::synthetic::SyntheticCache cache(gen);
    EXPECT_TRUE(cache.isSynthetic());

    std::string first = cache.get(Category::EMAIL, "alice@example.com");
    cache.get(Category::EMAIL, "bob@example.com");
    std::string again = cache.get(Category::EMAIL, "alice@example.com");
    EXPECT_EQ(first, again);
    EXPECT_NE(first, "alice@example.com");
    EXPECT_EQ(cache.size(), (size_t)2);

    // the category is part of the key
    cache.get(Category::PHONE, "alice@example.com");
    EXPECT_EQ(cache.size(), (size_t)3);
}

TEST(SyntheticCacheTest, PlaceholderWithoutGenerator) {
    using piiguard::core::Category;
    piiguard::synthetic::UnavailableSyntheticGenerator gen;
    piiguard::synthetic::SyntheticCache cache(gen);
    EXPECT_FALSE(cache.isSynthetic());
    EXPECT_EQ(cache.get(Category::EMAIL, "alice@example.com"), "[REDACTED_EMAIL]");
    EXPECT_EQ(cache.get(Category::PHONE, "555-123-4567"), "[REDACTED_PHONE]");
    EXPECT_EQ(cache.size(), (size_t)0);
}

#endif // PIIGUARD_TEST_UNIT_TEST_SYNTHETIC_HPP
