#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "json.hpp"

/**
 * \brief Durable storage for a single named record.
 */
class StateStorage {
public:
    virtual ~StateStorage() = default;

    [[nodiscard]] virtual bool exists() const = 0;

    [[nodiscard]] virtual std::string read() const = 0;

    virtual void write(const std::string &contents) = 0;

    virtual void remove() = 0;
};

/**
 * \brief Stores the record in a file. Writes go to a sibling temporary file which then replaces the
 * target, so readers never observe a partial record.
 */
class FileStateStorage : public StateStorage {
public:
    explicit FileStateStorage(std::filesystem::path path): path(std::move(path)) {
    }

    [[nodiscard]] bool exists() const override;

    [[nodiscard]] std::string read() const override;

    void write(const std::string &contents) override;

    void remove() override;

private:
    std::filesystem::path path;
};

/**
 * \brief Serializes the durable subset of SessionState and applies the caching policy.
 */
class TokenStore {
public:
    TokenStore(std::shared_ptr<StateStorage> storage, bool cache_state);

    // No-op unless caching is enabled
    void persist(const SessionState &state) const;

    /**
     * \brief Loads a previously persisted session.
     *
     * With caching disabled any leftover record is deleted and nothing is returned.
     * An unreadable record is deleted as well.
     */
    [[nodiscard]] std::optional<SessionState> restore() const;

    void discard() const;

private:
    std::shared_ptr<StateStorage> storage;
    bool cache_state;
};
