#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace cascade::script {

// Offset into the FileSet's global address space. Zero means "no position".
using Pos = std::int64_t;

enum class NodeKind {
    Root,
    List,
    Symbol,
    Int,
    Float,
    String
};

struct Node {
    NodeKind kind = NodeKind::Root;
    Pos pos = 0;

    std::int64_t intValue = 0;
    double floatValue = 0.0;
    // Symbol name or string literal contents.
    std::string text;
    // Elements of a list, or the top-level forms of a root.
    std::vector<Node> items;
};

// FileSet assigns every parsed source a disjoint range of positions so a
// single Pos identifies both the file and the offset inside it.
class FileSet {
public:
    // Registers a source and returns the base position of its first byte.
    Pos addFile(const std::string &name, const std::string &content);

    // Renders "name:line:column", or an empty string for an unknown position.
    std::string position(Pos pos) const;

private:
    struct File {
        std::string name;
        Pos base = 0;
        Pos size = 0;
        std::vector<Pos> lineStarts;
    };

    mutable std::mutex m_mutex;
    std::vector<File> m_files;
    Pos m_nextBase = 1;
};

} // namespace cascade::script
