#include "../shared/cpp/llm_sdk/include/conversation_memory.hpp"
#include "../shared/cpp/llm_sdk/include/errors.hpp"
#include "../shared/cpp/llm_sdk/include/util.hpp"
#include <gtest/gtest.h>

TEST(ConversationMemory, AppendsInOrderAndClears) {
    ConversationMemory m;
    m.append_exchange("hi", "hello");
    m.append(Speaker::Human, "bye");
    ASSERT_EQ(m.size(), 3u);
    EXPECT_EQ(m.turns()[1].speaker, Speaker::Assistant);
    EXPECT_EQ(m.transcript(), "Human: hi\nAI: hello\nHuman: bye\n");
    m.clear();
    EXPECT_TRUE(m.empty());
}

TEST(ConversationMemory, InstancesAreIndependent) {
    ConversationMemory a, b;
    a.append(Speaker::Human, "secret");
    EXPECT_TRUE(b.empty());
}

TEST(Util, CosineSimilarity) {
    EXPECT_NEAR(cosine_similarity({1, 0}, {1, 0}), 1.0f, 1e-6);
    EXPECT_NEAR(cosine_similarity({1, 0}, {0, 1}), 0.0f, 1e-6);
    EXPECT_NEAR(cosine_similarity({1, 0}, {-1, 0}), -1.0f, 1e-6);
    EXPECT_EQ(cosine_similarity({0, 0}, {1, 0}), 0.0f);
}

TEST(Util, Utf8Preview) {
    EXPECT_EQ(utf8_preview("short", 10), "short");
    EXPECT_EQ(utf8_preview("abcdef", 3), "abc...");
    EXPECT_EQ(utf8_preview("\xC3\xA9\xC3\xA9\xC3\xA9", 2), "\xC3\xA9\xC3\xA9...");
    EXPECT_EQ(utf8_length("\xC3\xA9x"), 2u);
}

TEST(Util, Sha1Hex) {
    EXPECT_EQ(sha1_hex("abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(Util, ParseIntArg) {
    EXPECT_EQ(parse_int_arg("--top-k", "7"), 7);
    EXPECT_THROW(parse_int_arg("--top-k", "seven"), ConfigError);
    EXPECT_THROW(parse_int_arg("--top-k", "7x"), ConfigError);
    EXPECT_EQ(parse_size_arg("--chunk-size", "0"), 0u);
    EXPECT_EQ(parse_size_arg("--chunk-size", "500"), 500u);
    EXPECT_THROW(parse_size_arg("--top-k", "-1"), ConfigError);
    EXPECT_THROW(parse_size_arg("--chunk-size", "-1000"), ConfigError);
}

TEST(Util, TrimAndLower) {
    EXPECT_EQ(trim("  a b \n"), "a b");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(to_lower("MiXeD"), "mixed");
}
