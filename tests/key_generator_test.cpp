#include "key_generator.h"
#include "cache_error.h"
#include <gtest/gtest.h>
#include <set>

TEST(KeyGeneratorTest, RandomKeysAreVersion4Uuids) {
    RandomKeyGenerator gen(42);
    for (int i = 0; i < 100; i++) {
        std::string key = gen.next();
        ASSERT_TRUE(RandomKeyGenerator::is_uuid(key)) << key;
        EXPECT_EQ(key[14], '4');
        EXPECT_NE(std::string("89ab").find(key[19]), std::string::npos) << key;
    }
}

TEST(KeyGeneratorTest, RandomKeysDoNotRepeat) {
    RandomKeyGenerator gen;
    std::set<std::string> seen;
    for (int i = 0; i < 1000; i++) {
        EXPECT_TRUE(seen.insert(gen.next()).second);
    }
}

TEST(KeyGeneratorTest, IsUuid) {
    EXPECT_TRUE(RandomKeyGenerator::is_uuid("0b7e4e7c-2b5c-4f07-9a55-3f5e1c7f9d10"));
    EXPECT_FALSE(RandomKeyGenerator::is_uuid("0B7E4E7C-2B5C-4F07-9A55-3F5E1C7F9D10"));
    EXPECT_FALSE(RandomKeyGenerator::is_uuid("0b7e4e7c2b5c4f079a553f5e1c7f9d10"));
    EXPECT_FALSE(RandomKeyGenerator::is_uuid("../7e4e7c-2b5c-4f07-9a55-3f5e1c7f9d10"));
    EXPECT_FALSE(RandomKeyGenerator::is_uuid(""));
}

TEST(KeyGeneratorTest, StructuredAcceptsSafePaths) {
    EXPECT_TRUE(StructuredKeyGenerator::is_valid("logo.png"));
    EXPECT_TRUE(StructuredKeyGenerator::is_valid("images/2024/logo.png"));
    EXPECT_TRUE(StructuredKeyGenerator::is_valid("with space and-dash_underscore"));
    EXPECT_TRUE(StructuredKeyGenerator::is_valid("a..b"));
}

TEST(KeyGeneratorTest, StructuredRejectsUnsafePaths) {
    std::string reason;
    EXPECT_FALSE(StructuredKeyGenerator::is_valid("", &reason));
    EXPECT_EQ(reason, "key is empty");

    EXPECT_FALSE(StructuredKeyGenerator::is_valid("..", &reason));
    EXPECT_FALSE(StructuredKeyGenerator::is_valid("a/../b", &reason));
    EXPECT_FALSE(StructuredKeyGenerator::is_valid("./a", &reason));
    EXPECT_FALSE(StructuredKeyGenerator::is_valid(".hidden", &reason));
    EXPECT_EQ(reason, "path segment starts with '.'");

    EXPECT_FALSE(StructuredKeyGenerator::is_valid("/abs", &reason));
    EXPECT_FALSE(StructuredKeyGenerator::is_valid("trailing/", &reason));
    EXPECT_FALSE(StructuredKeyGenerator::is_valid("a//b", &reason));
    EXPECT_EQ(reason, "empty path segment");

    EXPECT_FALSE(StructuredKeyGenerator::is_valid("back\\slash", &reason));
    EXPECT_FALSE(StructuredKeyGenerator::is_valid("what?", &reason));
    EXPECT_EQ(reason, "reserved character");

    EXPECT_FALSE(StructuredKeyGenerator::is_valid(std::string("nul\0byte", 8), &reason));
    EXPECT_FALSE(StructuredKeyGenerator::is_valid("tab\there", &reason));
    EXPECT_EQ(reason, "control character");

    EXPECT_FALSE(StructuredKeyGenerator::is_valid(std::string(256, 'x'), &reason));
    EXPECT_EQ(reason, "path segment is too long");
    EXPECT_TRUE(StructuredKeyGenerator::is_valid(std::string(255, 'x')));
}

TEST(KeyGeneratorTest, ResolveRandomReRollsTakenKeys) {
    KeyGenerator gen(KeyStrategy::Random);
    int calls = 0;
    std::string key = gen.resolve(std::nullopt, [&calls](const std::string&) {
        return ++calls < 3;   // first two candidates are taken
    });
    EXPECT_EQ(calls, 3);
    EXPECT_TRUE(RandomKeyGenerator::is_uuid(key));
}

TEST(KeyGeneratorTest, ResolveRandomGivesUpWhenEverythingIsTaken) {
    KeyGenerator gen(KeyStrategy::Random);
    EXPECT_THROW(gen.resolve(std::nullopt, [](const std::string&) { return true; }), KeyCollision);
}

TEST(KeyGeneratorTest, ResolveStructured) {
    KeyGenerator gen(KeyStrategy::Structured);
    auto never = [](const std::string&) { return false; };
    EXPECT_EQ(gen.strategy(), KeyStrategy::Structured);
    EXPECT_EQ(gen.resolve(std::string("logo.png"), never), "logo.png");
    EXPECT_THROW(gen.resolve(std::nullopt, never), InvalidKey);
    EXPECT_THROW(gen.resolve(std::string("../x"), never), InvalidKey);
}

TEST(KeyGeneratorTest, ResolveRandomWithSuppliedKey) {
    KeyGenerator gen(KeyStrategy::Random);
    auto never = [](const std::string&) { return false; };
    EXPECT_EQ(gen.strategy(), KeyStrategy::Random);
    const std::string uuid = "0b7e4e7c-2b5c-4f07-9a55-3f5e1c7f9d10";
    EXPECT_EQ(gen.resolve(uuid, never), uuid);
    EXPECT_THROW(gen.resolve(std::string("logo.png"), never), InvalidKey);
}
