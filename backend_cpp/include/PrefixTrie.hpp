#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>

namespace code_extraction {

enum PathFlag : uint8_t {
    NONE = 0,
    IGNORE = 1 << 0,
    INCLUDE = 1 << 1  // overrides IGNORE on a deeper segment
};

// Path-segment trie for batch ignore/include prefixes.
class PrefixTrie {
    struct Node {
        std::unordered_map<std::string, std::unique_ptr<Node>> children;
        uint8_t flags = PathFlag::NONE;
    };

    std::unique_ptr<Node> root;

public:
    PrefixTrie() : root(std::make_unique<Node>()) {}

    void insert(const std::string& path, PathFlag flag) {
        Node* current = root.get();
        std::filesystem::path p = std::filesystem::path(path).lexically_normal();

        for (const auto& part : p) {
            std::string segment = part.string();
            if (segment == "." || segment.empty() || segment == "/") continue;

            auto& child = current->children[segment];
            if (!child) child = std::make_unique<Node>();
            current = child.get();
        }
        current->flags |= flag;
    }

    // Flags of the deepest flagged prefix of `path`. A parent rule applies to every
    // descendant unless a deeper rule replaces it.
    uint8_t check(const std::filesystem::path& path) const {
        const Node* current = root.get();
        uint8_t accumulated_flags = PathFlag::NONE;

        for (const auto& part : path.lexically_normal()) {
            std::string segment = part.string();
            if (segment == "." || segment.empty() || segment == "/") continue;

            auto it = current->children.find(segment);
            if (it == current->children.end()) break;
            current = it->second.get();
            if (current->flags != PathFlag::NONE) accumulated_flags = current->flags;
        }
        return accumulated_flags;
    }

    bool ignored(const std::filesystem::path& path) const {
        uint8_t flags = check(path);
        return (flags & PathFlag::IGNORE) && !(flags & PathFlag::INCLUDE);
    }

    void clear() {
        root = std::make_unique<Node>();
    }
};

} // namespace code_extraction
