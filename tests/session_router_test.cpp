#include "../services/session/include/session_router.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

const char* kNotes =
    "Bananas are yellow fruit grown in tropical climates. "
    "Zebras are striped animals living on the savanna.";

class SessionRouterTest : public ::testing::Test {
protected:
    RouteReply call(const std::string& method, const std::string& path, const std::string& body = {},
                    std::map<std::string, std::string> query = {}) {
        return router.handle({method, path, std::move(query), body});
    }

    RouteReply upload(const std::string& text, const std::string& name = "notes.txt") {
        return call("POST", "/documents", text, {{"name", name}});
    }

    static std::string error_of(const RouteReply& r) {
        return json::parse(r.body).at("error").get<std::string>();
    }

    LetterEmbedder embedder;
    ScriptedLlm llm{{"Bananas are yellow."}};
    SessionRouter router{embedder, llm};
};

} // namespace

TEST_F(SessionRouterTest, HealthAndFormats) {
    auto health = call("GET", "/health");
    EXPECT_EQ(health.status, 200);
    EXPECT_EQ(json::parse(health.body).at("chat_state"), "empty");

    auto formats = call("GET", "/formats");
    EXPECT_EQ(formats.status, 200);
    EXPECT_EQ(json::parse(formats.body).at("formats"), json({"pdf", "docx", "doc", "txt"}));
}

TEST_F(SessionRouterTest, UploadThenAsk) {
    auto up = upload(kNotes);
    ASSERT_EQ(up.status, 200);
    EXPECT_EQ(json::parse(up.body).at("document"), "notes.txt");
    EXPECT_GE(json::parse(up.body).at("chunks").get<size_t>(), 1u);
    EXPECT_EQ(json::parse(call("GET", "/health").body).at("chat_state"), "indexed");

    auto ask = call("POST", "/ask", json({{"question", "What colour are bananas?"}}).dump());
    ASSERT_EQ(ask.status, 200);
    auto j = json::parse(ask.body);
    EXPECT_EQ(j.at("answer"), "Bananas are yellow.");
    EXPECT_EQ(j.at("question"), "What colour are bananas?");
    EXPECT_FALSE(j.at("sources").empty());
    EXPECT_EQ(j.at("sources")[0].at("metadata").at("source"), "notes.txt");
}

TEST_F(SessionRouterTest, AskWithoutDocumentIsConflict) {
    auto r = call("POST", "/ask", json({{"question", "anything"}}).dump());
    EXPECT_EQ(r.status, 409);
    EXPECT_FALSE(error_of(r).empty());
}

TEST_F(SessionRouterTest, BadUploadsAreBadRequest) {
    auto csv = call("POST", "/documents", "a,b", {{"name", "table.csv"}});
    EXPECT_EQ(csv.status, 400);
    EXPECT_NE(error_of(csv).find("csv"), std::string::npos);

    EXPECT_EQ(upload(" \n ").status, 400);
    EXPECT_EQ(call("POST", "/documents", kNotes).status, 400);
    EXPECT_EQ(call("POST", "/documents", kNotes, {{"name", "notes"}, {"type", "xls"}}).status, 400);
}

TEST_F(SessionRouterTest, MalformedJsonIsBadRequest) {
    ASSERT_EQ(upload(kNotes).status, 200);
    EXPECT_EQ(call("POST", "/ask", "not json").status, 400);
    EXPECT_EQ(call("POST", "/ask", json({{"q", "missing key"}}).dump()).status, 400);
    EXPECT_EQ(call("POST", "/research", "{").status, 400);
}

TEST_F(SessionRouterTest, InvalidIterationCapIsBadRequest) {
    auto r = call("POST", "/research", json({{"query", "2+2"}, {"max_iterations", 0}}).dump());
    EXPECT_EQ(r.status, 400);
}

TEST_F(SessionRouterTest, ModelFailuresAreBadGateway) {
    embedder.fail_after = 0;
    EXPECT_EQ(upload(kNotes).status, 502);

    embedder.fail_after = -1;
    ASSERT_EQ(upload(kNotes).status, 200);
    llm.fail = true;
    auto r = call("POST", "/ask", json({{"question", "What colour are bananas?"}}).dump());
    EXPECT_EQ(r.status, 502);
    EXPECT_EQ(error_of(r), "model endpoint unreachable");
}

TEST_F(SessionRouterTest, ResearchReportsModelFailureInBody) {
    llm.fail = true;
    auto r = call("POST", "/research", json({{"query", "What is 2+2?"}}).dump());
    ASSERT_EQ(r.status, 200);
    auto j = json::parse(r.body);
    EXPECT_FALSE(j.at("success").get<bool>());
    EXPECT_FALSE(j.at("error").is_null());
}

TEST_F(SessionRouterTest, ResearchAndTools) {
    auto tools = json::parse(call("GET", "/tools").body).at("tools");
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0].at("name"), "calculator");

    auto r = call("POST", "/research", json({{"query", "Tell me about bananas"}}).dump());
    ASSERT_EQ(r.status, 200);
    auto j = json::parse(r.body);
    EXPECT_TRUE(j.at("success").get<bool>());
    EXPECT_EQ(j.at("response"), "Bananas are yellow.");
    EXPECT_TRUE(j.at("error").is_null());
    EXPECT_EQ(call("DELETE", "/research/memory").status, 200);
}

TEST_F(SessionRouterTest, UnknownRoutesAreNotFound) {
    EXPECT_EQ(call("GET", "/nope").status, 404);
    EXPECT_EQ(call("GET", "/ask").status, 404);
    EXPECT_EQ(call("PUT", "/research").status, 404);
    EXPECT_EQ(error_of(call("GET", "/nope")), "not found");
}

TEST_F(SessionRouterTest, ClearRoutesResetTheSession) {
    ASSERT_EQ(upload(kNotes).status, 200);
    EXPECT_EQ(call("DELETE", "/chat/history").status, 200);
    EXPECT_EQ(call("DELETE", "/documents").status, 200);
    EXPECT_EQ(json::parse(call("GET", "/health").body).at("chat_state"), "empty");
    EXPECT_EQ(json::parse(call("GET", "/summary").body).at("summary"), "No document uploaded.");
}
