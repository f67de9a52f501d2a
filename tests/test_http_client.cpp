#include <catch2/catch_test_macros.hpp>

#include "transcription/chat_cleanup.hpp"
#include "transcription/http_client.hpp"
#include "transcription/whisper_provider.hpp"

#include <nlohmann/json.hpp>

TEST_CASE("http::classify", "[http]") {
    auto kind_of = [](long status) {
        return http::classify(http::Response{.status = status, .body = ""}).kind;
    };

    REQUIRE(kind_of(401) == ProviderErrorKind::Auth);
    REQUIRE(kind_of(403) == ProviderErrorKind::Auth);
    REQUIRE(kind_of(408) == ProviderErrorKind::Timeout);
    REQUIRE(kind_of(413) == ProviderErrorKind::SizeLimit);
    REQUIRE(kind_of(429) == ProviderErrorKind::RateLimited);
    REQUIRE(kind_of(400) == ProviderErrorKind::BadRequest);
    REQUIRE(kind_of(500) == ProviderErrorKind::Server);
    REQUIRE(kind_of(503) == ProviderErrorKind::Server);

    auto err = http::classify(http::Response{.status = 429, .body = ""});
    REQUIRE(err.http_status == 429);
    REQUIRE(is_retryable(err.kind));
    REQUIRE_FALSE(is_retryable(kind_of(401)));
    REQUIRE_FALSE(is_retryable(kind_of(413)));
}

TEST_CASE("http::error_message", "[http]") {
    SECTION("OpenAiStyle") {
        REQUIRE(http::error_message(R"({"error":{"message":"Invalid API key","type":"auth"}})") ==
                "Invalid API key");
    }

    SECTION("WhisperCppStyle") {
        REQUIRE(http::error_message(R"({"error":"failed to read audio"})") ==
                "failed to read audio");
    }

    SECTION("PlainBodyIsTruncated") {
        std::string body(500, 'x');
        auto msg = http::error_message(body);
        REQUIRE(msg.size() == 203);
        REQUIRE(msg.ends_with("..."));
    }

    SECTION("NonJsonPassesThrough") {
        REQUIRE(http::error_message("Bad Gateway") == "Bad Gateway");
    }
}

TEST_CASE("trim_transcript", "[http]") {
    REQUIRE(trim_transcript("  hello world\n") == "hello world");
    REQUIRE(trim_transcript(" \n\t ").empty());
    REQUIRE(trim_transcript("").empty());
}

TEST_CASE("ChatCleanupProvider request body", "[http]") {
    auto body = nlohmann::json::parse(
        ChatCleanupProvider::build_request("llama-3.3-70b-versatile", "euh bonjour"));

    REQUIRE(body["model"] == "llama-3.3-70b-versatile");
    REQUIRE(body["messages"].size() == 2);
    REQUIRE(body["messages"][0]["role"] == "system");
    REQUIRE(body["messages"][1]["role"] == "user");
    auto content = body["messages"][1]["content"].get<std::string>();
    REQUIRE(content.find("euh bonjour") != std::string::npos);
    REQUIRE(content.starts_with("[TRANSCRIPTION]"));
}
