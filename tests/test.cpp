#include <algorithm>
#include <set>

#include "graph_coro.hpp"
#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

static bool has_refresh_scope(const GraphConfig &config) {
    return std::find(config.scopes.begin(), config.scopes.end(), REFRESH_SCOPE) != config.scopes.end();
}

SCENARIO("normalize_scopes adds offline_access when refresh is enabled") {
    initLogging();
    GIVEN("A configuration with refresh enabled") {
        auto config = test_config(false, true);
        WHEN("offline_access was not requested") {
            config.normalize_scopes();
            THEN("offline_access is appended") {
                REQUIRE(config.scopes == std::vector<std::string>{"Mail.Read", "offline_access"});
            }
        }
        WHEN("offline_access was already requested") {
            config.scopes = {"offline_access", "Mail.Read"};
            config.normalize_scopes();
            THEN("it appears exactly once") {
                REQUIRE(std::count(config.scopes.begin(), config.scopes.end(), "offline_access") == 1);
            }
        }
    }
}

SCENARIO("normalize_scopes removes offline_access when refresh is disabled") {
    initLogging();
    GIVEN("A configuration with refresh disabled that explicitly requests offline_access") {
        auto config = test_config(false, false);
        config.scopes = {"User.Read", "offline_access", "Mail.Read", "offline_access"};
        WHEN("the scopes are normalized") {
            config.normalize_scopes();
            THEN("offline_access is gone and the order of the others is kept") {
                REQUIRE_FALSE(has_refresh_scope(config));
                REQUIRE(config.scopes == std::vector<std::string>{"User.Read", "Mail.Read"});
            }
        }
    }
}

SCENARIO("A session always normalizes the scopes it was given") {
    initLogging();
    GIVEN("Configurations whose scopes contradict their refresh setting") {
        auto with_refresh = test_config(false, true);
        with_refresh.scopes = {"Mail.Read"};
        auto without_refresh = test_config(false, false);
        without_refresh.scopes = {"Mail.Read", "offline_access"};
        WHEN("sessions are constructed from them") {
            const GraphSession refreshing(with_refresh, std::make_shared<FakeHttpClient>(),
                                          std::make_shared<MemoryStateStorage>());
            const GraphSession non_refreshing(without_refresh, std::make_shared<FakeHttpClient>(),
                                              std::make_shared<MemoryStateStorage>());
            THEN("the refresh setting wins") {
                REQUIRE(has_refresh_scope(refreshing.configuration()));
                REQUIRE_FALSE(has_refresh_scope(non_refreshing.configuration()));
            }
        }
    }
}

SCENARIO("resolve_endpoint joins relative paths onto the API root") {
    initLogging();
    GIVEN("The default configuration") {
        const GraphConfig config;
        THEN("relative paths are joined regardless of leading slashes") {
            REQUIRE(config.resolve_endpoint("me") == "https://graph.microsoft.com/v1.0/me");
            REQUIRE(config.resolve_endpoint("/me") == "https://graph.microsoft.com/v1.0/me");
            REQUIRE(config.resolve_endpoint("///me/messages") == "https://graph.microsoft.com/v1.0/me/messages");
        }
        THEN("absolute URLs are returned unchanged") {
            REQUIRE(config.resolve_endpoint("https://example.com/api") == "https://example.com/api");
            REQUIRE(config.resolve_endpoint("HTTP://example.com/api") == "HTTP://example.com/api");
        }
        THEN("resolving twice gives the same URL") {
            const auto once = config.resolve_endpoint("me/drive");
            REQUIRE(config.resolve_endpoint(once) == once);
        }
    }
    GIVEN("A resource without a trailing slash and the beta API") {
        GraphConfig config;
        config.resource = "https://graph.example.com";
        config.api_version = "beta";
        THEN("the parts are still separated") {
            REQUIRE(config.resolve_endpoint("me") == "https://graph.example.com/beta/me");
        }
    }
}

SCENARIO("from_json merges overrides onto the defaults") {
    initLogging();
    GIVEN("A JSON configuration with an unknown key") {
        const auto root = json_of(R"({
            "client_id": "abc",
            "client_secret": "secret",
            "redirect_uri": "http://localhost:5000/login/authorized",
            "scopes": ["User.Read", "offline_access"],
            "refresh_enable": false,
            "cache_state": true,
            "clientid": "typo"
        })");
        WHEN("it is parsed") {
            const auto config = GraphConfig::from_json(root);
            THEN("the known keys are applied and the unknown key is ignored") {
                REQUIRE(config.client_id == "abc");
                REQUIRE(config.client_secret == "secret");
                REQUIRE(config.cache_state);
                REQUIRE_FALSE(config.refresh_enable);
                REQUIRE(config.scopes == std::vector<std::string>{"User.Read"});
                REQUIRE(config.resource == GRAPH_RESOURCE);
                REQUIRE(config.state_file == "state.json");
            }
        }
    }
    GIVEN("A JSON configuration overriding the authority") {
        const auto root = json_of(R"({"client_id": "abc", "authority_url": "https://login.example.com/tenant"})");
        WHEN("it is parsed") {
            const auto config = GraphConfig::from_json(root);
            THEN("the endpoints are derived from the new authority") {
                REQUIRE(config.auth_endpoint == "https://login.example.com/tenant/oauth2/v2.0/authorize");
                REQUIRE(config.token_endpoint == "https://login.example.com/tenant/oauth2/v2.0/token");
            }
        }
    }
    GIVEN("A JSON configuration with a wrongly typed value") {
        const auto root = json_of(R"({"client_id": 42})");
        THEN("A runtime_error should be thrown") {
            REQUIRE_THROWS_AS(GraphConfig::from_json(root), std::runtime_error);
        }
    }
}

SCENARIO("parse_query decodes callback parameters") {
    initLogging();
    GIVEN("A redirect URL as the provider sends it") {
        const std::string url =
                "http://localhost:5000/login/authorized?code=M.R3_BAY%2Fabc&state=1234-abcd&session_state=x+y#frag";
        WHEN("it is parsed") {
            const auto params = parse_query(url);
            THEN("the values are decoded") {
                REQUIRE(params.at("code") == "M.R3_BAY/abc");
                REQUIRE(params.at("state") == "1234-abcd");
                REQUIRE(params.at("session_state") == "x y");
                REQUIRE(params.size() == 3);
            }
        }
    }
}

SCENARIO("generate_uuid returns distinct version 4 identifiers") {
    const auto first = generate_uuid();
    const auto second = generate_uuid();
    REQUIRE(first.size() == 36);
    REQUIRE(first[14] == '4');
    REQUIRE(first != second);
}

SCENARIO("generate_uuid does not repeat across many draws") {
    GIVEN("A thousand generated identifiers") {
        std::set<std::string> seen;
        std::set<char> variants;
        for (int i = 0; i < 1000; i++) {
            const auto id = generate_uuid();
            seen.insert(id);
            variants.insert(id[19]);
        }
        THEN("all of them are distinct with an RFC 4122 variant digit") {
            REQUIRE(seen.size() == 1000);
            for (const auto variant: variants) {
                REQUIRE(std::string("89ab").find(variant) != std::string::npos);
            }
        }
        THEN("every identifier is lowercase hex separated by dashes") {
            for (const auto &id: seen) {
                REQUIRE(std::all_of(id.begin(), id.end(), [](const char c) {
                    return c == '-' || (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
                }));
            }
        }
    }
}
