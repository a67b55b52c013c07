#include "config/document_reader.hpp"
#include <fstream>
#include <sstream>

namespace cadence {

KeySet::KeySet(std::initializer_list<std::string> keys)
    : keys_(keys) {
}

KeySet::KeySet(std::vector<std::string> keys)
    : keys_(std::move(keys)) {
}

std::string KeySet::toString() const {
    std::string result;
    for (const auto& key : keys_) {
        if (!result.empty()) {
            result += "|";
        }
        result += key;
    }
    return result;
}

DocumentReader::DocumentReader(const YAML::Node& node, const std::string& path)
    : node_(node)
    , path_(path) {
}

DocumentReader DocumentReader::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DocumentFormatError("Cannot open document: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromString(buffer.str());
}

DocumentReader DocumentReader::fromString(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw DocumentFormatError("Invalid YAML content: " + std::string(e.what()));
    }
    if (!root || root.IsNull()) {
        root = YAML::Node(YAML::NodeType::Map);
    }
    return DocumentReader(root);
}

bool DocumentReader::has(const KeySet& keys) const {
    return findKey(keys).has_value();
}

std::optional<std::string> DocumentReader::findKey(const KeySet& keys) const {
    if (!node_.IsMap()) {
        return std::nullopt;
    }
    for (const auto& key : keys.getKeys()) {
        if (node_[key]) {
            return key;
        }
    }
    return std::nullopt;
}

DocumentReader DocumentReader::child(const KeySet& keys) const {
    std::string key;
    const YAML::Node value = valueFor(keys, key);
    if (!value.IsMap()) {
        throw DocumentFormatError(pathFor(key) + ": expected a mapping");
    }
    return DocumentReader(value, pathFor(key));
}

std::vector<DocumentReader> DocumentReader::elements(const KeySet& keys) const {
    std::string key;
    const YAML::Node value = valueFor(keys, key);
    return DocumentReader(value, pathFor(key)).elements();
}

std::vector<DocumentReader> DocumentReader::elements() const {
    if (!node_.IsSequence()) {
        throw DocumentFormatError((path_.empty() ? std::string("document") : path_) +
                                  ": expected a sequence");
    }
    std::vector<DocumentReader> items;
    for (size_t i = 0; i < node_.size(); ++i) {
        items.emplace_back(node_[i], path_ + "[" + std::to_string(i) + "]");
    }
    return items;
}

std::string DocumentReader::dump() const {
    YAML::Emitter out;
    out << node_;
    return out.c_str();
}

std::string DocumentReader::pathFor(const std::string& key) const {
    return path_.empty() ? key : path_ + "." + key;
}

YAML::Node DocumentReader::valueFor(const KeySet& keys, std::string& key) const {
    const auto found = findKey(keys);
    if (!found) {
        const std::string where = path_.empty() ? std::string("document") : path_;
        throw DocumentKeyError(where + ": none of the keys " + keys.toString() + " found");
    }
    key = *found;
    return node_[key];
}

} // namespace cadence
