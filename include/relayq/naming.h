/**
 * @file naming.h
 * @brief Mapping between discovered items, local artifacts and remote keys
 *
 * ArtifactNaming owns the three naming rules used outside the core state
 * machine: filesystem-safe payload names, TaskID recovery from a filename,
 * and bucketing of a logical key into a remote directory.
 */

#ifndef RELAYQ_NAMING_H
#define RELAYQ_NAMING_H

#include "relayq/task.h"

#include <optional>
#include <regex>
#include <string>

namespace relayq {

class ArtifactNaming {
public:
    /**
     * @brief Construct naming rules
     * @param payload_extension Extension of completed payloads (e.g. ".mp4")
     * @param id_pattern Regex matching a TaskID inside a filename
     * @throws RelayqException if id_pattern is not a valid regex
     */
    ArtifactNaming(const std::string& payload_extension, const std::string& id_pattern);

    /**
     * @brief Filesystem-safe name for a title, with the payload extension
     *
     * Alphanumerics, space, '.', '_' and '-' are kept; anything else becomes
     * '_'. The extension is appended unless already present.
     */
    std::string safeFileName(const std::string& title) const;

    /**
     * @brief Payload filename for a discovered item (title, or ID if untitled)
     */
    std::string payloadFileName(const DiscoveredItem& item) const;

    /**
     * @brief Recover the TaskID from a payload or partial filename
     * @return ID, or nullopt if the name carries none
     */
    std::optional<std::string> idFromFileName(const std::string& file_name) const;

    /**
     * @brief Check whether a filename is a completed payload
     */
    bool isPayloadFile(const std::string& file_name) const;

    /**
     * @brief Remote directory for a logical key
     *
     * "ABC-XYZ-1234567" -> "ABC-XYZ-120": keep the first three digits of the
     * numeric tail and zero the last. Shorter tails zero their last digit;
     * keys without a numeric tail map to "<key>-0".
     */
    static std::string bucketFor(const std::string& logical_key);

    /**
     * @brief Remote path "<bucket>/<file_name>" for a key and a filename
     */
    static std::string remotePathFor(const std::string& logical_key,
                                     const std::string& file_name);

    const std::string& payloadExtension() const { return payload_extension_; }

private:
    std::string payload_extension_;
    std::regex id_regex_;
};

} // namespace relayq

#endif // RELAYQ_NAMING_H
