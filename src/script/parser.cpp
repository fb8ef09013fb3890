#include "script/parser.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace cascade::script {

namespace {

bool isDelimiter(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) || c == '(' || c == ')'
        || c == '"' || c == ';';
}

class Parser {
public:
    Parser(const FileSet &fileSet, const std::string &source, Pos base)
        : m_fileSet(fileSet)
        , m_source(source)
        , m_base(base)
    {
    }

    Node parseRoot()
    {
        Node root;
        root.kind = NodeKind::Root;
        root.pos = m_base;

        while (true) {
            skipBlank();
            if (atEnd()) {
                break;
            }
            if (peek() == ')') {
                fail(m_offset, "unexpected ')'");
            }
            root.items.push_back(parseForm());
        }
        return root;
    }

private:
    const FileSet &m_fileSet;
    const std::string &m_source;
    Pos m_base = 0;
    std::size_t m_offset = 0;

    bool atEnd() const
    {
        return m_offset >= m_source.size();
    }

    char peek() const
    {
        return m_source[m_offset];
    }

    Pos posAt(std::size_t offset) const
    {
        return m_base + static_cast<Pos>(offset);
    }

    [[noreturn]] void fail(std::size_t offset, const std::string &message) const
    {
        throw ParseError(m_fileSet.position(posAt(offset)), message);
    }

    void skipBlank()
    {
        while (!atEnd()) {
            const char c = peek();
            if (c == ';') {
                while (!atEnd() && peek() != '\n') {
                    ++m_offset;
                }
            } else if (std::isspace(static_cast<unsigned char>(c))) {
                ++m_offset;
            } else {
                return;
            }
        }
    }

    Node parseForm()
    {
        const char c = peek();
        if (c == '(') {
            return parseList();
        }
        if (c == '"') {
            return parseString();
        }
        return parseAtom();
    }

    Node parseList()
    {
        Node list;
        list.kind = NodeKind::List;
        list.pos = posAt(m_offset);
        const std::size_t open = m_offset;
        ++m_offset;

        while (true) {
            skipBlank();
            if (atEnd()) {
                fail(open, "unclosed '('");
            }
            if (peek() == ')') {
                ++m_offset;
                return list;
            }
            list.items.push_back(parseForm());
        }
    }

    Node parseString()
    {
        Node node;
        node.kind = NodeKind::String;
        node.pos = posAt(m_offset);
        const std::size_t open = m_offset;
        ++m_offset;

        while (true) {
            if (atEnd()) {
                fail(open, "unterminated string literal");
            }
            const char c = peek();
            ++m_offset;
            if (c == '"') {
                return node;
            }
            if (c != '\\') {
                node.text.push_back(c);
                continue;
            }
            if (atEnd()) {
                fail(open, "unterminated string literal");
            }
            const char escaped = peek();
            switch (escaped) {
            case 'n':
                node.text.push_back('\n');
                break;
            case 't':
                node.text.push_back('\t');
                break;
            case 'r':
                node.text.push_back('\r');
                break;
            case '\\':
                node.text.push_back('\\');
                break;
            case '"':
                node.text.push_back('"');
                break;
            default:
                fail(m_offset - 1, std::string("invalid escape sequence '\\") + escaped + "'");
            }
            ++m_offset;
        }
    }

    Node parseAtom()
    {
        const std::size_t start = m_offset;
        while (!atEnd() && !isDelimiter(peek())) {
            ++m_offset;
        }
        const std::string token = m_source.substr(start, m_offset - start);

        Node node;
        node.pos = posAt(start);
        if (looksNumeric(token)) {
            parseNumber(token, start, node);
        } else {
            node.kind = NodeKind::Symbol;
            node.text = token;
        }
        return node;
    }

    static bool looksNumeric(const std::string &token)
    {
        std::size_t i = 0;
        if (token[0] == '-' || token[0] == '+') {
            i = 1;
        }
        return i < token.size() && std::isdigit(static_cast<unsigned char>(token[i]));
    }

    void parseNumber(const std::string &token, std::size_t start, Node &node) const
    {
        const bool isHex = token.find("0x") != std::string::npos
            || token.find("0X") != std::string::npos;
        const bool isFloat = !isHex
            && token.find_first_of(".eE") != std::string::npos;

        char *end = nullptr;
        errno = 0;
        if (isFloat) {
            node.kind = NodeKind::Float;
            node.floatValue = std::strtod(token.c_str(), &end);
        } else {
            node.kind = NodeKind::Int;
            node.intValue = std::strtoll(token.c_str(), &end, 0);
        }

        if (end != token.c_str() + token.size()) {
            fail(start, "invalid number literal '" + token + "'");
        }
        if (errno == ERANGE) {
            fail(start, "number literal out of range '" + token + "'");
        }
    }
};

} // namespace

Node parse(FileSet &fileSet, const std::string &name, const std::string &source)
{
    const Pos base = fileSet.addFile(name, source);
    Parser parser(fileSet, source, base);
    return parser.parseRoot();
}

} // namespace cascade::script
