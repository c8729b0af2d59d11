#include "state_storage.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "spdlog/spdlog.h"

bool FileStateStorage::exists() const {
    return std::filesystem::is_regular_file(path);
}

std::string FileStateStorage::read() const {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("failed to open state file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void FileStateStorage::write(const std::string &contents) {
    auto temporary = path;
    temporary += ".tmp";

    {
        std::ofstream file(temporary, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("failed to open state file for write: " + temporary.string());
        }

        // The record holds bearer credentials, restrict the file while it is still empty
        std::error_code ec;
        std::filesystem::permissions(temporary,
                                     std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace, ec);
        if (ec) {
            const auto reason = ec.message();
            file.close();
            std::filesystem::remove(temporary, ec);
            throw std::runtime_error("failed to restrict permissions on " + temporary.string() + ": " + reason);
        }

        file << contents;
        file.flush();
        if (!file) {
            file.close();
            std::filesystem::remove(temporary, ec);
            throw std::runtime_error("failed to write state file: " + temporary.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temporary, path, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(temporary, cleanup);
        throw std::runtime_error("failed to replace state file " + path.string() + ": " + ec.message());
    }
    spdlog::debug("Wrote state file {}", path.string());
}

void FileStateStorage::remove() {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        throw std::runtime_error("failed to remove state file " + path.string() + ": " + ec.message());
    }
}

TokenStore::TokenStore(std::shared_ptr<StateStorage> storage, const bool cache_state)
    : storage(std::move(storage)), cache_state(cache_state) {
    if (!this->storage) {
        throw std::invalid_argument("token store requires a storage backend");
    }
}

void TokenStore::persist(const SessionState &state) const {
    if (!cache_state) {
        return;
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    storage->write(Json::writeString(writer, session_state_to_json(state)));
    spdlog::debug("Persisted session state");
}

std::optional<SessionState> TokenStore::restore() const {
    if (!storage->exists()) {
        return std::nullopt;
    }

    if (!cache_state) {
        spdlog::info("State caching is disabled, removing stale session record");
        storage->remove();
        return std::nullopt;
    }

    const auto root = parse_json(storage->read());
    if (!root || !root->isObject()) {
        spdlog::warn("Discarding unreadable session record");
        storage->remove();
        return std::nullopt;
    }

    spdlog::debug("Restored session record");
    return session_state_from_json(*root);
}

void TokenStore::discard() const {
    if (storage->exists()) {
        storage->remove();
        spdlog::debug("Removed session record");
    }
}
