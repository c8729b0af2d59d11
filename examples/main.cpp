#include <iostream>
#include <map>

#include <spdlog/spdlog.h>

#include "graph_coro.hpp"
#include "cppcoro/sync_wait.hpp"

// Stands in for a web route: redirects are printed and query parameters come from a pasted URL
class ConsoleRequest : public RequestContext {
public:
    explicit ConsoleRequest(std::map<std::string, std::string> params = {}): params(std::move(params)) {
    }

    [[nodiscard]] std::string query(const std::string &name) const override {
        const auto it = params.find(name);
        return it == params.end() ? std::string() : it->second;
    }

    void redirect(const std::string &location, const int status) override {
        spdlog::info("Redirect ({}): {}", status, location);
        last_location = location;
    }

    std::string last_location;

private:
    std::map<std::string, std::string> params;
};

int main(const int argc, char *argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S %z] [%^%L%$] [thread %t] %v");

    const std::string config_path = argc > 1 ? argv[1] : "config.json";

    try {
        GraphSession session(GraphConfig::from_file(config_path));
        spdlog::info("{}", session.describe());

        ConsoleRequest login_request;
        sync_wait(session.login(login_request, "/me"));

        if (session.auth_phase() == AuthPhase::AwaitingCallback) {
            spdlog::info("Please login via the Auth URL above, then paste the URL you were redirected to: ");
            std::string callback_url;
            std::cin >> callback_url;

            ConsoleRequest callback_request(parse_query(callback_url));
            if (!sync_wait(session.handle_callback(callback_request))) {
                spdlog::error("Login failed, no access token was issued");
                return 1;
            }
        }

        const auto me = sync_wait(session.api_get("me"));
        spdlog::info("Logged in as {} <{}>", me["displayName"].asString(), me["userPrincipalName"].asString());
        spdlog::info("Granted scopes: {}", session.session_state().token_scope);
        spdlog::info("Token expires in {}s", session.seconds_until_expiry());
    } catch (const std::exception &e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}
