/**
 * @file naming.cpp
 * @brief Implementation of ArtifactNaming
 */

#include "relayq/naming.h"
#include "relayq/errors.h"

#include <algorithm>
#include <cctype>

namespace relayq {

namespace {

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // anonymous namespace

ArtifactNaming::ArtifactNaming(const std::string& payload_extension,
                               const std::string& id_pattern)
    : payload_extension_(payload_extension) {
    try {
        id_regex_ = std::regex(id_pattern);
    } catch (const std::regex_error& e) {
        throw RelayqException(ErrorCode::FILE_PARSE_ERROR,
                              "Invalid id pattern '" + id_pattern + "': " + e.what());
    }
}

std::string ArtifactNaming::safeFileName(const std::string& title) const {
    std::string name;
    name.reserve(title.size() + payload_extension_.size());

    for (char c : title) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == ' ' || c == '.' || c == '_' || c == '-') {
            name += c;
        } else {
            name += '_';
        }
    }

    if (!endsWith(toLower(name), toLower(payload_extension_))) {
        name += payload_extension_;
    }
    return name;
}

std::string ArtifactNaming::payloadFileName(const DiscoveredItem& item) const {
    return safeFileName(item.title.empty() ? item.id : item.title);
}

std::optional<std::string> ArtifactNaming::idFromFileName(const std::string& file_name) const {
    std::string stem = file_name;
    if (isPartialPath(stem)) {
        stem.resize(stem.size() - std::string(kPartialSuffix).size());
    }
    if (endsWith(toLower(stem), toLower(payload_extension_))) {
        stem.resize(stem.size() - payload_extension_.size());
    }

    std::smatch match;
    if (std::regex_search(stem, match, id_regex_)) {
        return match.str(0);
    }
    return std::nullopt;
}

bool ArtifactNaming::isPayloadFile(const std::string& file_name) const {
    return !isPartialPath(file_name) &&
           endsWith(toLower(file_name), toLower(payload_extension_));
}

std::string ArtifactNaming::bucketFor(const std::string& logical_key) {
    size_t tail_start = logical_key.size();
    while (tail_start > 0 &&
           std::isdigit(static_cast<unsigned char>(logical_key[tail_start - 1]))) {
        --tail_start;
    }

    std::string prefix = logical_key.substr(0, tail_start);
    std::string digits = logical_key.substr(tail_start);

    if (digits.empty()) {
        return logical_key + "-0";
    }
    if (digits.size() > 3) {
        digits.resize(3);
    }
    digits.back() = '0';
    return prefix + digits;
}

std::string ArtifactNaming::remotePathFor(const std::string& logical_key,
                                          const std::string& file_name) {
    return bucketFor(logical_key) + "/" + file_name;
}

} // namespace relayq
