#pragma once

#include "common/errors.hpp"
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace cadence {

// Alternative spellings of one document field. Lookup tries them in order.
class KeySet {
public:
    KeySet(std::initializer_list<std::string> keys);
    explicit KeySet(std::vector<std::string> keys);

    const std::vector<std::string>& getKeys() const { return keys_; }
    // "a|b|c"
    std::string toString() const;

private:
    std::vector<std::string> keys_;
};

// Read-only view over a YAML node with flexible key lookup. Every reader
// carries the path it was reached by so errors can point at the input.
class DocumentReader {
public:
    explicit DocumentReader(const YAML::Node& node, const std::string& path = "");

    // Throws DocumentFormatError for unreadable files or malformed YAML.
    // An empty document reads as an empty mapping.
    static DocumentReader fromFile(const std::string& path);
    static DocumentReader fromString(const std::string& text);

    bool isMap() const { return node_.IsMap(); }
    bool isSequence() const { return node_.IsSequence(); }
    bool isScalar() const { return node_.IsScalar(); }
    const YAML::Node& getNode() const { return node_; }
    const std::string& getPath() const { return path_; }

    bool has(const KeySet& keys) const;
    // First key of the set present in this mapping
    std::optional<std::string> findKey(const KeySet& keys) const;

    // Throws DocumentKeyError when no key matches, DocumentTypeError when the
    // value does not convert to T
    template <typename T>
    T get(const KeySet& keys) const;

    // Falls back only when the key is absent; a present value of the wrong type still throws
    template <typename T>
    T get(const KeySet& keys, const T& fallback) const;

    // Throws DocumentKeyError when absent, DocumentFormatError when not a mapping
    DocumentReader child(const KeySet& keys) const;
    // Items of a sequence field, DocumentFormatError when not a sequence
    std::vector<DocumentReader> elements(const KeySet& keys) const;
    // Items of this node when it is a sequence
    std::vector<DocumentReader> elements() const;

    std::string dump() const;

    std::string pathFor(const std::string& key) const;

private:
    YAML::Node valueFor(const KeySet& keys, std::string& key) const;

    YAML::Node node_;
    std::string path_;
};

template <typename T>
T DocumentReader::get(const KeySet& keys) const {
    std::string key;
    const YAML::Node value = valueFor(keys, key);
    try {
        return value.as<T>();
    } catch (const YAML::Exception&) {
        throw DocumentTypeError(pathFor(key) + ": value has the wrong type");
    }
}

template <typename T>
T DocumentReader::get(const KeySet& keys, const T& fallback) const {
    if (!has(keys)) {
        return fallback;
    }
    return get<T>(keys);
}

} // namespace cadence
