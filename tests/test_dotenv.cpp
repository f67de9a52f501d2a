#include <catch2/catch_test_macros.hpp>

#include "dotenv.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace {

struct TmpDir {
    std::filesystem::path path;

    TmpDir() {
        path = std::filesystem::temp_directory_path() /
               ("ms_test_env_" + std::to_string(getpid()));
        std::filesystem::create_directories(path);
    }

    ~TmpDir() { std::filesystem::remove_all(path); }

    void write_env(const std::string& content) const {
        std::ofstream(path / ".env") << content;
    }
};

} // namespace

TEST_CASE("dotenv::parse", "[dotenv]") {

    SECTION("KeyValueLines") {
        auto vars = dotenv::parse("GROQ_API_KEY=gsk_123\nOPENAI_API_KEY=sk-456\n");
        REQUIRE(vars.size() == 2);
        REQUIRE(vars["GROQ_API_KEY"] == "gsk_123");
        REQUIRE(vars["OPENAI_API_KEY"] == "sk-456");
    }

    SECTION("CommentsAndBlankLines") {
        auto vars = dotenv::parse("# keys\n\n   \nA=1\n  # indented comment\n");
        REQUIRE(vars.size() == 1);
        REQUIRE(vars["A"] == "1");
    }

    SECTION("QuotedValues") {
        auto vars = dotenv::parse("A=\"with spaces\"\nB='single'\nC=\"unterminated\n");
        REQUIRE(vars["A"] == "with spaces");
        REQUIRE(vars["B"] == "single");
        REQUIRE(vars["C"] == "\"unterminated");
    }

    SECTION("ExportPrefixAndWhitespace") {
        auto vars = dotenv::parse("export  KEY = value \r\n");
        REQUIRE(vars["KEY"] == "value");
    }

    SECTION("InlineCommentAfterUnquotedValue") {
        auto vars = dotenv::parse("KEY=value # trailing\n");
        REQUIRE(vars["KEY"] == "value");
    }

    SECTION("MalformedLinesIgnored") {
        auto vars = dotenv::parse("no equals sign\n=novalue\nOK=yes");
        REQUIRE(vars.size() == 1);
        REQUIRE(vars["OK"] == "yes");
    }

    SECTION("ValueMayContainEquals") {
        auto vars = dotenv::parse("URL=http://host/?a=b");
        REQUIRE(vars["URL"] == "http://host/?a=b");
    }
}

TEST_CASE("dotenv::load", "[dotenv]") {
    TmpDir dir;

    SECTION("SetsUnsetVariables") {
        ::unsetenv("MS_TEST_DOTENV_A");
        dir.write_env("MS_TEST_DOTENV_A=from_file\n");

        REQUIRE(dotenv::load((dir.path / ".env").string()) == 1);
        REQUIRE(std::string(std::getenv("MS_TEST_DOTENV_A")) == "from_file");
        ::unsetenv("MS_TEST_DOTENV_A");
    }

    SECTION("ExistingEnvironmentWins") {
        ::setenv("MS_TEST_DOTENV_B", "from_env", 1);
        dir.write_env("MS_TEST_DOTENV_B=from_file\n");

        dotenv::load((dir.path / ".env").string());
        REQUIRE(std::string(std::getenv("MS_TEST_DOTENV_B")) == "from_env");
        ::unsetenv("MS_TEST_DOTENV_B");
    }

    SECTION("MissingFile") {
        REQUIRE(dotenv::load((dir.path / "absent.env").string()) == -1);
    }

    SECTION("LoadFirstSkipsDirectoriesWithoutEnv") {
        ::unsetenv("MS_TEST_DOTENV_C");
        dir.write_env("MS_TEST_DOTENV_C=found\n");

        REQUIRE(dotenv::load_first({"", "/nonexistent/ms", dir.path.string()}) == 1);
        REQUIRE(std::string(std::getenv("MS_TEST_DOTENV_C")) == "found");
        ::unsetenv("MS_TEST_DOTENV_C");
    }
}
