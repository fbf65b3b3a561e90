#pragma once

#include <optional>
#include <string>
#include <vector>

namespace zktable {

/**
 * Non-watching read access to the coordination service namespace.
 *
 * Implementations own connection and session handling. Callers borrow an
 * instance per call and never close it.
 */
class CoordinationClient {
public:
    virtual ~CoordinationClient() = default;

    /**
     * Read the payload of a node.
     *
     * @param path Absolute node path
     * @return Node payload, or std::nullopt if the node does not exist
     * @throws CoordinationError on communication or protocol failure
     */
    virtual std::optional<std::string> get_data(const std::string& path) = 0;

    /**
     * List the names of a node's direct children.
     *
     * @param path Absolute path of the parent node
     * @return Child names, empty if the parent does not exist
     * @throws CoordinationError on communication or protocol failure
     */
    virtual std::vector<std::string> list_children(const std::string& path) = 0;
};

/**
 * Join a parent path and a child name with a single '/'.
 */
inline std::string join_path(const std::string& parent, const std::string& child) {
    if (!parent.empty() && parent.back() == '/') {
        return parent + child;
    }
    return parent + "/" + child;
}

} // namespace zktable
