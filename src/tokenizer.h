#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QMetaType>
#include <cstdint>

namespace rfl {

class KeywordDictionary;

// ── Sections ──

enum class Section : uint8_t {
    None, Settings, Variables, TestCases, Keywords, Comments
};

const char* sectionName(Section s);

// ── Token classes ──

enum class TokenClass : uint8_t {
    Plain,
    Heading,
    Comment,
    Definition,
    VariableName,
    Meta,
    Keyword,
    Function,      // builtin keyword call
    String,
    Number,
    AttributeName, // named-argument key
    Punctuation,   // cell separator
};

inline constexpr int kTokenClassCount = 12;

const char* tokenClassName(TokenClass c);

struct Token {
    TokenClass cls;
    int start;
    int end;       // exclusive

    int length() const { return end - start; }
    bool operator==(const Token& o) const { return cls == o.cls && start == o.start && end == o.end; }
};

// State carried from the end of one line to the start of the next.
struct ScanState {
    Section section = Section::None;
    bool definitionLine = false;

    // Packed form for editor line-state storage. toInt() is never 0 so a
    // host can tell a stored state from an unset slot.
    int toInt() const;
    static ScanState fromInt(int packed);

    bool operator==(const ScanState& o) const {
        return section == o.section && definitionLine == o.definitionLine;
    }
    bool operator!=(const ScanState& o) const { return !(*this == o); }
};

struct LineResult {
    QVector<Token> tokens;
    ScanState state;       // state after this line
};

// ── Line Tokenizer ─────────────────────────────────────────────────────

class LineTokenizer {
public:
    explicit LineTokenizer(const KeywordDictionary& dict) : m_dict(dict) {}

    // Tokens for one line (without its line terminator) given the state
    // left by the previous line. Never fails; always covers the whole line.
    LineResult tokenizeLine(const QString& line, const ScanState& in = {}) const;

    // Feeds lines in order, threading state from each into the next.
    QVector<LineResult> tokenizeLines(const QStringList& lines, ScanState in = {}) const;

    const KeywordDictionary& dictionary() const { return m_dict; }

private:
    const KeywordDictionary& m_dict;
};

} // namespace rfl

Q_DECLARE_METATYPE(rfl::Section)
