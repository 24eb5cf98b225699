#include "tokenizer.h"
#include "keywords.h"
#include <QRegularExpression>
#include <cstring>

namespace rfl {

// ── Name tables ──

struct SectionMeta {
    Section     section;
    const char* name;
};

static constexpr SectionMeta kSectionMeta[] = {
    {Section::None,      "none"},
    {Section::Settings,  "settings"},
    {Section::Variables, "variables"},
    {Section::TestCases, "testcases"},
    {Section::Keywords,  "keywords"},
    {Section::Comments,  "comments"},
};

const char* sectionName(Section s) {
    for (const auto& m : kSectionMeta)
        if (m.section == s) return m.name;
    return "none";
}

static constexpr const char* kTokenClassNames[kTokenClassCount] = {
    "plain", "heading", "comment", "definition", "variableName", "meta",
    "keyword", "function", "string", "number", "attributeName", "punctuation",
};

const char* tokenClassName(TokenClass c) {
    int i = static_cast<int>(c);
    return (i >= 0 && i < kTokenClassCount) ? kTokenClassNames[i] : "plain";
}

// ── ScanState packing ──
//
//   bit 0     definition line
//   bits 1-3  section
//   bit 8     always set (distinguishes a stored state from 0)

static constexpr int kStateMarker = 0x100;

int ScanState::toInt() const {
    return kStateMarker | (static_cast<int>(section) << 1) | (definitionLine ? 1 : 0);
}

ScanState ScanState::fromInt(int packed) {
    ScanState s;
    if (!(packed & kStateMarker))
        return s;
    int sec = (packed >> 1) & 0x7;
    if (sec <= static_cast<int>(Section::Comments))
        s.section = static_cast<Section>(sec);
    s.definitionLine = (packed & 1) != 0;
    return s;
}

// ── Vocabulary ──

static const char* const kSettingTags[] = {
    "Setup", "Tags", "Teardown", "Documentation", "Arguments", "Return", "Template", "Timeout",
};

static const char* const kDirectives[] = {
    "Library", "Resource", "Variables", "Suite Setup", "Suite Teardown", "Test Setup",
    "Test Teardown", "Test Template", "Test Timeout", "Force Tags", "Default Tags", "Metadata",
};

// Longer alternatives precede their prefixes ("ELSE IF" before "ELSE").
static const char* const kControlWords[] = {
    "IN ENUMERATE", "IN RANGE", "IN ZIP", "ELSE IF", "CONTINUE", "FINALLY", "EXCEPT",
    "RETURN", "BREAK", "WHILE", "ELSE", "FOR", "END", "TRY", "IF", "IN",
};

static const char* const kBddPrefixes[] = {
    "Given", "When", "Then", "And", "But",
};

static const QRegularExpression& headerPattern() {
    static const QRegularExpression re(
        QStringLiteral("^\\*{3,}\\s*(settings?|variables?|test cases?|tasks?|keywords?|comments?)\\s*\\**"),
        QRegularExpression::CaseInsensitiveOption);
    return re;
}

static Section sectionFromHeader(const QString& name) {
    QString n = name.toLower();
    if (n.startsWith(QLatin1String("setting")))  return Section::Settings;
    if (n.startsWith(QLatin1String("variable"))) return Section::Variables;
    if (n.startsWith(QLatin1String("keyword")))  return Section::Keywords;
    if (n.startsWith(QLatin1String("comment")))  return Section::Comments;
    return Section::TestCases;  // "test case(s)" / "task(s)"
}

static bool isAsciiLetter(QChar c) {
    auto u = c.unicode();
    return (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z');
}

static bool isAsciiDigit(QChar c) {
    auto u = c.unicode();
    return u >= '0' && u <= '9';
}

static bool isWordChar(QChar c) {
    return isAsciiLetter(c) || isAsciiDigit(c) || c == '_';
}

// ── Line scanner ───────────────────────────────────────────────────────
//
// One instance per line. Each match* rule looks at m_pos and, when it
// applies, reports the end of its span through `end`; the first rule that
// applies wins. Every rule that matches consumes at least one character.

class LineScanner {
public:
    LineScanner(const QString& line, const ScanState& in, const KeywordDictionary& dict)
        : m_line(line), m_dict(dict), m_state(in) {}

    LineResult run() {
        m_state.definitionLine = false;
        if (!scanLineStart()) {
            while (!atEnd())
                scanToken();
        }
        return {m_tokens, m_state};
    }

private:
    const QString& m_line;
    const KeywordDictionary& m_dict;
    ScanState m_state;
    int m_pos = 0;
    QVector<Token> m_tokens;

    // ── Helpers ──

    bool atEnd() const { return m_pos >= m_line.size(); }

    QChar at(int i) const { return i < m_line.size() ? m_line[i] : QChar(); }

    void push(TokenClass cls, int end) {
        m_tokens.append({cls, m_pos, end});
        m_pos = end;
    }

    // `text` at position pos, ASCII case folded when cs is CaseInsensitive.
    bool textAt(int pos, const char* text, Qt::CaseSensitivity cs) const {
        for (int i = 0; text[i]; i++) {
            QChar a = at(pos + i);
            QChar b = QLatin1Char(text[i]);
            if (cs == Qt::CaseInsensitive ? a.toLower() != b.toLower() : a != b)
                return false;
        }
        return true;
    }

    // Whole-word variant: no word character on either side.
    bool wordAt(int pos, const char* text, Qt::CaseSensitivity cs) const {
        if (pos > 0 && isWordChar(m_line[pos - 1]))
            return false;
        if (!textAt(pos, text, cs))
            return false;
        return !isWordChar(at(pos + int(std::strlen(text))));
    }

    int wordEnd(int i) const {
        while (isAsciiLetter(at(i)) || isAsciiDigit(at(i)))
            i++;
        return i;
    }

    // End of an identifier at pos that is directly followed by '=', or -1.
    int namedArgKeyEnd(int pos) const {
        if (!isAsciiLetter(at(pos)) && at(pos) != '_')
            return -1;
        int i = pos + 1;
        while (isWordChar(at(i)))
            i++;
        return at(i) == '=' ? i : -1;
    }

    // ── Start of line ──

    // Returns true when the line has been consumed entirely.
    bool scanLineStart() {
        if (m_line.isEmpty())
            return true;

        QRegularExpressionMatch m = headerPattern().match(m_line);
        if (m.hasMatch()) {
            m_state.section = sectionFromHeader(m.captured(1));
            push(TokenClass::Heading, m.capturedEnd(0));
            return false;
        }

        if (m_state.section == Section::Comments) {
            push(TokenClass::Comment, m_line.size());
            return true;
        }

        if ((m_state.section == Section::TestCases || m_state.section == Section::Keywords)
            && !m_line[0].isSpace()) {
            m_state.definitionLine = true;
            push(TokenClass::Definition, m_line.size());
            return true;
        }
        return false;
    }

    // ── Rules ──

    void scanToken() {
        int end = m_pos;
        TokenClass cls = classify(end);
        Q_ASSERT(end > m_pos);
        push(cls, end);
    }

    TokenClass classify(int& end) {
        TokenClass cls = TokenClass::Plain;
        if (matchComment(end))        return TokenClass::Comment;
        if (matchSeparator(end))      return TokenClass::Punctuation;
        if (matchVariable(end))       return TokenClass::VariableName;
        if (matchSettingTag(end))     return TokenClass::Meta;
        if (matchDirective(end))      return TokenClass::Meta;
        if (matchControlWord(end))    return TokenClass::Keyword;
        if (matchKeywordCall(end, cls)) return cls;
        if (matchString(end))         return TokenClass::String;
        if (matchNumber(end))         return TokenClass::Number;
        if (matchNamedArgKey(end))    return TokenClass::AttributeName;
        if (matchWhitespace(end))     return TokenClass::Plain;

        // Fallback: one code point, unclassified
        end = m_pos + 1;
        if (m_line[m_pos].isHighSurrogate() && at(end).isLowSurrogate())
            end++;
        return TokenClass::Plain;
    }

    bool matchComment(int& end) const {
        if (at(m_pos) != '#')
            return false;
        end = m_line.size();
        return true;
    }

    // Two or more blanks, or any run containing a tab
    bool matchSeparator(int& end) const {
        int i = m_pos;
        bool tab = false;
        while (at(i) == ' ' || at(i) == '\t') {
            tab |= (at(i) == '\t');
            i++;
        }
        if (i - m_pos < 2 && !tab)
            return false;
        end = i;
        return true;
    }

    // ${...}, @{...}, %{...}, &{...} with nesting; unterminated runs to EOL
    bool matchVariable(int& end) const {
        QChar sigil = at(m_pos);
        if (sigil != '$' && sigil != '@' && sigil != '%' && sigil != '&')
            return false;
        if (at(m_pos + 1) != '{')
            return false;

        int depth = 1;
        int i = m_pos + 2;
        while (depth > 0 && i < m_line.size()) {
            if (m_line[i] == '{')
                depth++;
            else if (m_line[i] == '}')
                depth--;
            i++;
        }
        end = i;
        return true;
    }

    // [Setup], [Tags], ... (case-insensitive)
    bool matchSettingTag(int& end) const {
        if (at(m_pos) != '[')
            return false;
        for (const char* tag : kSettingTags) {
            int len = int(std::strlen(tag));
            if (textAt(m_pos + 1, tag, Qt::CaseInsensitive) && at(m_pos + 1 + len) == ']') {
                end = m_pos + len + 2;
                return true;
            }
        }
        return false;
    }

    bool matchDirective(int& end) const {
        if (m_state.section != Section::Settings)
            return false;
        for (const char* name : kDirectives) {
            if (wordAt(m_pos, name, Qt::CaseInsensitive)) {
                end = m_pos + int(std::strlen(name));
                return true;
            }
        }
        return false;
    }

    bool matchControlWord(int& end) const {
        for (const char* word : kControlWords) {
            if (wordAt(m_pos, word, Qt::CaseSensitive)) {
                end = m_pos + int(std::strlen(word));
                return true;
            }
        }
        for (const char* word : kBddPrefixes) {
            if (wordAt(m_pos, word, Qt::CaseInsensitive)) {
                end = m_pos + int(std::strlen(word));
                return true;
            }
        }
        return false;
    }

    // Greedy multi-word lookup. The run is cut at the longest phrase the
    // dictionary holds for the first word; longer runs cannot match.
    bool matchKeywordCall(int& end, TokenClass& cls) const {
        if (!isAsciiLetter(at(m_pos)))
            return false;
        if (namedArgKeyEnd(m_pos) >= 0)
            return false;

        int firstEnd = wordEnd(m_pos);
        int limit = m_dict.maxWordsFor(m_line.mid(m_pos, firstEnd - m_pos).toLower());

        QVector<int> wordEnds{firstEnd};
        int i = firstEnd;
        while (wordEnds.size() < limit && at(i) == ' ' && isAsciiLetter(at(i + 1))) {
            i = wordEnd(i + 1);
            wordEnds.append(i);
        }

        for (int k = wordEnds.size() - 1; k >= 0; k--) {
            // Words are joined by single spaces, so only case needs folding
            QString candidate = m_line.mid(m_pos, wordEnds[k] - m_pos).toLower();
            if (m_dict.contains(candidate)) {
                end = wordEnds[k];
                cls = TokenClass::Function;
                return true;
            }
        }

        end = firstEnd;
        cls = TokenClass::Plain;
        return true;
    }

    bool matchString(int& end) const {
        QChar quote = at(m_pos);
        if (quote != '"' && quote != '\'')
            return false;
        for (int i = m_pos + 1; i < m_line.size(); i++) {
            if (m_line[i] == '\\') {
                i++;  // escaped character
                continue;
            }
            if (m_line[i] == quote) {
                end = i + 1;
                return true;
            }
        }
        return false;
    }

    // -?digits(.digits)?
    bool matchNumber(int& end) const {
        int i = m_pos;
        if (at(i) == '-')
            i++;
        if (!isAsciiDigit(at(i)))
            return false;
        while (isAsciiDigit(at(i)))
            i++;
        if (at(i) == '.' && isAsciiDigit(at(i + 1))) {
            i++;
            while (isAsciiDigit(at(i)))
                i++;
        }
        end = i;
        return true;
    }

    bool matchNamedArgKey(int& end) const {
        int keyEnd = namedArgKeyEnd(m_pos);
        if (keyEnd < 0)
            return false;
        end = keyEnd;
        return true;
    }

    bool matchWhitespace(int& end) const {
        int i = m_pos;
        while (i < m_line.size() && m_line[i].isSpace())
            i++;
        if (i == m_pos)
            return false;
        end = i;
        return true;
    }
};

// ── Public API ─────────────────────────────────────────────────────────

LineResult LineTokenizer::tokenizeLine(const QString& line, const ScanState& in) const {
    LineScanner scanner(line, in, m_dict);
    return scanner.run();
}

QVector<LineResult> LineTokenizer::tokenizeLines(const QStringList& lines, ScanState in) const {
    QVector<LineResult> results;
    results.reserve(lines.size());
    for (const QString& line : lines) {
        results.append(tokenizeLine(line, in));
        in = results.last().state;
    }
    return results;
}

} // namespace rfl
