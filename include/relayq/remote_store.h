/**
 * @file remote_store.h
 * @brief Remote storage abstraction used by RelayEngine
 *
 * Paths are relative to the store root and use '/' separators. Every method
 * throws RelayqException (RELAY_* codes) when the store cannot be reached or
 * the operation fails.
 */

#ifndef RELAYQ_REMOTE_STORE_H
#define RELAYQ_REMOTE_STORE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace relayq {

/**
 * @brief Sequential writer for one remote object
 *
 * Data becomes visible at the remote path only on commit(); destroying an
 * uncommitted writer discards what was written.
 */
class RemoteWriter {
public:
    virtual ~RemoteWriter() = default;

    virtual void write(const char* data, std::size_t size) = 0;

    virtual void commit() = 0;
};

class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    /**
     * @brief Size of a remote object
     * @return Size in bytes, or nullopt if nothing exists at the path
     */
    virtual std::optional<std::uint64_t> stat(const std::string& remote_path) = 0;

    /**
     * @brief Create a remote directory and its parents if missing
     */
    virtual void ensureDirectory(const std::string& remote_dir) = 0;

    /**
     * @brief Open a writer that replaces remote_path on commit
     */
    virtual std::unique_ptr<RemoteWriter> openWriter(const std::string& remote_path) = 0;
};

} // namespace relayq

#endif // RELAYQ_REMOTE_STORE_H
