#pragma once
#include <stdexcept>
#include <string>
#include <utility>

/**
 * \brief Thrown when an authorization callback carries a state that does not match the pending nonce.
 *
 * The flow attempt is aborted and the session is left untouched.
 */
class StateMismatchError : public std::runtime_error {
public:
    StateMismatchError(const std::string &expected, const std::string &received)
        : std::runtime_error("state mismatch: " + (expected.empty() ? std::string("<none>") : expected) +
                             " sent, " + received + " received"),
          expected(expected), received(received) {
    }

    std::string expected;
    std::string received;
};

/**
 * \brief Thrown when a call to the token endpoint or the API fails below the OAuth layer:
 * network errors, unexpected HTTP statuses or bodies that are not JSON.
 */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string &message, const long status_code = 0, std::string body = {})
        : std::runtime_error(message), status_code(status_code), body(std::move(body)) {
    }

    long status_code;
    std::string body;
};
