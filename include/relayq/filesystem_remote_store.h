/**
 * @file filesystem_remote_store.h
 * @brief RemoteStore over a mounted share directory
 */

#ifndef RELAYQ_FILESYSTEM_REMOTE_STORE_H
#define RELAYQ_FILESYSTEM_REMOTE_STORE_H

#include "relayq/remote_store.h"

#include <string>

namespace relayq {

/**
 * @brief Stores remote objects as files below a root directory
 *
 * The root must exist (an unmounted share is reported as
 * RELAY_REMOTE_UNAVAILABLE). Writes go to "<path>.relayq-tmp" and are
 * renamed over the target on commit.
 */
class FilesystemRemoteStore : public RemoteStore {
public:
    explicit FilesystemRemoteStore(const std::string& root);

    std::optional<std::uint64_t> stat(const std::string& remote_path) override;

    void ensureDirectory(const std::string& remote_dir) override;

    std::unique_ptr<RemoteWriter> openWriter(const std::string& remote_path) override;

    const std::string& root() const { return root_; }

private:
    /// @throws RelayqException if the path has a ".." component
    std::string resolve(const std::string& remote_path) const;
    void requireRoot() const;

    std::string root_;
};

} // namespace relayq

#endif // RELAYQ_FILESYSTEM_REMOTE_STORE_H
