#include "script/ast.hpp"

#include <algorithm>

namespace cascade::script {

Pos FileSet::addFile(const std::string &name, const std::string &content)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    File file;
    file.name = name;
    file.base = m_nextBase;
    file.size = static_cast<Pos>(content.size());
    file.lineStarts.push_back(0);
    for (std::size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\n') {
            file.lineStarts.push_back(static_cast<Pos>(i + 1));
        }
    }

    // One extra slot so the end-of-file position still maps to this file.
    m_nextBase += file.size + 1;
    m_files.push_back(std::move(file));
    return m_files.back().base;
}

std::string FileSet::position(Pos pos) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto &file : m_files) {
        if (pos < file.base || pos > file.base + file.size) {
            continue;
        }
        const Pos offset = pos - file.base;
        auto it = std::upper_bound(file.lineStarts.begin(), file.lineStarts.end(), offset);
        const auto line = static_cast<std::size_t>(it - file.lineStarts.begin());
        const Pos column = offset - file.lineStarts[line - 1] + 1;
        return file.name + ":" + std::to_string(line) + ":" + std::to_string(column);
    }
    return {};
}

} // namespace cascade::script
