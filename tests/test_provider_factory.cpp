#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "transcription/provider_factory.hpp"

#include <cstdlib>

namespace {

Config two_providers() {
    Config cfg;
    cfg.providers = {
        {.name = "groq", .url = "https://api.groq.com/openai/v1", .api_format = "openai",
         .model = "whisper-large-v3", .cleanup_model = "llama-3.3-70b-versatile",
         .api_key_env = "MINDSCRIBE_TEST_GROQ_KEY"},
        {.name = "openai", .url = "https://api.openai.com/v1", .api_format = "openai",
         .model = "whisper-1", .cleanup_model = "", .api_key_env = "MINDSCRIBE_TEST_OPENAI_KEY"},
    };
    cfg.primary_provider = "groq";
    return cfg;
}

struct EnvGuard {
    ~EnvGuard() {
        ::unsetenv("MINDSCRIBE_TEST_GROQ_KEY");
        ::unsetenv("MINDSCRIBE_TEST_OPENAI_KEY");
    }
};

} // namespace

TEST_CASE("build_providers", "[transcription]") {
    EnvGuard guard;
    ::unsetenv("MINDSCRIBE_TEST_GROQ_KEY");
    ::unsetenv("MINDSCRIBE_TEST_OPENAI_KEY");

    SECTION("NoKeysNoProviders") {
        auto set = build_providers(two_providers());
        REQUIRE(set.transcribers.empty());
        REQUIRE(set.cleaners.empty());
        REQUIRE(set.skipped == std::vector<std::string>{"groq", "openai"});
    }

    SECTION("FailoverOrderFollowsPrimary") {
        ::setenv("MINDSCRIBE_TEST_GROQ_KEY", "gsk-test", 1);
        ::setenv("MINDSCRIBE_TEST_OPENAI_KEY", "sk-test", 1);

        auto cfg = two_providers();
        auto set = build_providers(cfg);
        REQUIRE(set.transcribers.size() == 2);
        REQUIRE(set.transcribers[0]->name() == "groq");
        REQUIRE(set.transcribers[1]->name() == "openai");

        cfg.primary_provider = "openai";
        set = build_providers(cfg);
        REQUIRE(set.transcribers[0]->name() == "openai");
        REQUIRE(set.transcribers[1]->name() == "groq");
    }

    SECTION("MissingKeySkipsOnlyThatProvider") {
        ::setenv("MINDSCRIBE_TEST_OPENAI_KEY", "sk-test", 1);

        auto set = build_providers(two_providers());
        REQUIRE(set.transcribers.size() == 1);
        REQUIRE(set.transcribers[0]->name() == "openai");
        REQUIRE(set.skipped == std::vector<std::string>{"groq"});
    }

    SECTION("CleanerOnlyWithCleanupModel") {
        ::setenv("MINDSCRIBE_TEST_GROQ_KEY", "gsk-test", 1);
        ::setenv("MINDSCRIBE_TEST_OPENAI_KEY", "sk-test", 1);

        auto set = build_providers(two_providers());
        REQUIRE(set.cleaners.size() == 1);
        REQUIRE(set.cleaners[0]->name() == "groq");
    }

    SECTION("WhisperCppNeedsNoKey") {
        Config cfg;
        cfg.providers = {{.name = "lan", .url = "http://192.168.1.20:8080",
                          .api_format = "whisper.cpp", .model = "", .cleanup_model = "llama",
                          .api_key_env = ""}};
        cfg.primary_provider = "lan";

        auto set = build_providers(cfg);
        REQUIRE(set.transcribers.size() == 1);
        REQUIRE(set.transcribers[0]->name() == "lan");
        REQUIRE(set.cleaners.empty());
        REQUIRE(set.skipped.empty());
    }
}
