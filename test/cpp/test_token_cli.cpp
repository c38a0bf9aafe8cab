#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_all.hpp>
#include <crow/json.h>
#include <sstream>
#include "token_cli.hpp"
#include "test_utils.hpp"

using namespace bootstrap;
using bootstrap::test::TempFile;

namespace {

struct CliRun {
    int exit_code;
    std::string out;
    std::string err;
};

CliRun runCli(std::vector<std::string> args) {
    args.insert(args.begin(), "bootstrap-token");
    std::ostringstream out;
    std::ostringstream err;
    int code = TokenCli::run(args, out, err);
    return CliRun{code, out.str(), err.str()};
}

} // namespace

TEST_CASE("TokenCli validate", "[cli]") {
    SECTION("Valid token") {
        auto result = runCli({"validate", "abcdef.abcdef0123456789"});
        REQUIRE(result.exit_code == TokenCli::kExitOk);
        REQUIRE(result.out == "valid\n");
    }

    SECTION("Invalid token") {
        auto result = runCli({"validate", "abcdef.ABCDEF0123456789"});
        REQUIRE(result.exit_code == TokenCli::kExitInvalid);
        REQUIRE_THAT(result.err, Catch::Matchers::StartsWith("error: InvalidSecret"));
        REQUIRE_THAT(result.err, !Catch::Matchers::ContainsSubstring("ABCDEF0123456789"));
    }

    SECTION("JSON output on success") {
        auto result = runCli({"validate", "--json", "abcdef.abcdef0123456789"});
        REQUIRE(result.exit_code == TokenCli::kExitOk);

        auto json = crow::json::load(result.out);
        REQUIRE(json);
        REQUIRE(json["success"].t() == crow::json::type::True);
        REQUIRE(std::string(json["id"].s()) == "abcdef");
        REQUIRE_FALSE(json.has("secret"));
    }

    SECTION("JSON output on failure") {
        auto result = runCli({"validate", "--json", "abcdef:abcdef0123456789"});
        REQUIRE(result.exit_code == TokenCli::kExitInvalid);

        auto json = crow::json::load(result.out);
        REQUIRE(json);
        REQUIRE(json["success"].t() == crow::json::type::False);
        REQUIRE(std::string(json["error"]["category"].s()) == "MalformedInput");
    }

    SECTION("Token from YAML file") {
        TempFile file("joinToken: 123456.aabbccddeeffgghh\n");
        auto result = runCli({"validate", "--file", file.path(), "--key", "joinToken"});
        REQUIRE(result.exit_code == TokenCli::kExitOk);
        REQUIRE(result.out == "valid\n");
    }

    SECTION("Missing YAML file") {
        auto result = runCli({"validate", "--file", "/nonexistent/dir/tokens.yaml"});
        REQUIRE(result.exit_code == TokenCli::kExitInvalid);
        REQUIRE_THAT(result.err, Catch::Matchers::StartsWith("error: Configuration"));
    }

    SECTION("Neither token nor file") {
        auto result = runCli({"validate"});
        REQUIRE(result.exit_code == TokenCli::kExitUsage);
    }
}

TEST_CASE("TokenCli split", "[cli]") {
    SECTION("Secret is masked by default") {
        auto result = runCli({"split", "abcdef.abcdef0123456789"});
        REQUIRE(result.exit_code == TokenCli::kExitOk);
        REQUIRE(result.out == "id: abcdef\nsecret: ****************\n");
    }

    SECTION("Secret shown on request") {
        auto result = runCli({"split", "--show-secret", "abcdef.abcdef0123456789"});
        REQUIRE(result.exit_code == TokenCli::kExitOk);
        REQUIRE(result.out == "id: abcdef\nsecret: abcdef0123456789\n");
    }

    SECTION("Invalid token") {
        auto result = runCli({"split", "abcdef"});
        REQUIRE(result.exit_code == TokenCli::kExitInvalid);
        REQUIRE(result.out.empty());
    }
}

TEST_CASE("TokenCli join", "[cli]") {
    SECTION("Valid parts") {
        auto result = runCli({"join", "123456", "aabbccddeeffgghh"});
        REQUIRE(result.exit_code == TokenCli::kExitOk);
        REQUIRE(result.out == "123456.aabbccddeeffgghh\n");
    }

    SECTION("Invalid secret") {
        auto result = runCli({"join", "123456", "AABBCCD-EEFFGGHH"});
        REQUIRE(result.exit_code == TokenCli::kExitInvalid);
        REQUIRE_THAT(result.err, Catch::Matchers::ContainsSubstring("16, 24"));
    }
}

TEST_CASE("TokenCli encode and decode", "[cli]") {
    SECTION("Encode") {
        auto result = runCli({"encode", "abcdef.abcdef0123456789"});
        REQUIRE(result.exit_code == TokenCli::kExitOk);
        REQUIRE(result.out == "\"abcdef.abcdef0123456789\"\n");
    }

    SECTION("Decode") {
        auto result = runCli({"decode", "\"abcdef.abcdef0123456789\""});
        REQUIRE(result.exit_code == TokenCli::kExitOk);
        REQUIRE(result.out == "abcdef.abcdef0123456789\n");
    }

    SECTION("Decode rejects unquoted input") {
        auto result = runCli({"decode", "abcdef.abcdef0123456789"});
        REQUIRE(result.exit_code == TokenCli::kExitInvalid);
        REQUIRE_THAT(result.err, Catch::Matchers::StartsWith("error: Decode"));
    }
}

TEST_CASE("TokenCli usage errors", "[cli]") {
    SECTION("No subcommand") {
        auto result = runCli({});
        REQUIRE(result.exit_code == TokenCli::kExitUsage);
    }

    SECTION("Help exits successfully without usage output") {
        auto result = runCli({"--help"});
        REQUIRE(result.exit_code == TokenCli::kExitOk);
        REQUIRE(result.err.empty());
    }

    SECTION("Subcommand help exits successfully") {
        auto result = runCli({"join", "--help"});
        REQUIRE(result.exit_code == TokenCli::kExitOk);
        REQUIRE(result.err.empty());
    }

    SECTION("Missing positional argument") {
        auto result = runCli({"join", "123456"});
        REQUIRE(result.exit_code == TokenCli::kExitUsage);
        REQUIRE_FALSE(result.err.empty());
    }
}

TEST_CASE("TokenCli::setLogLevel", "[cli]") {
    REQUIRE(TokenCli::setLogLevel("debug"));
    REQUIRE(TokenCli::setLogLevel("error"));
    REQUIRE_FALSE(TokenCli::setLogLevel("verbose"));
    REQUIRE(TokenCli::setLogLevel("warning"));
}
