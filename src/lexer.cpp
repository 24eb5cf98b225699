#include "lexer.h"
#include "keywords.h"
#include <Qsci/qsciscintilla.h>
#include <Qsci/qsciscintillabase.h>

namespace rfl {

RobotLexer::RobotLexer(const KeywordDictionary& dict, QObject* parent)
    : QsciLexerCustom(parent), m_tokenizer(dict), m_theme(Theme::dark())
{
    applyTheme(m_theme);
}

RobotLexer::~RobotLexer() = default;

const char* RobotLexer::language() const {
    return "Robot Framework";
}

QString RobotLexer::description(int style) const {
    if (style < 0 || style >= kTokenClassCount)
        return {};
    return QString::fromLatin1(tokenClassName(static_cast<TokenClass>(style)));
}

QColor RobotLexer::defaultColor(int style) const {
    if (style < 0 || style >= kTokenClassCount)
        return m_theme.text;
    return m_theme.colorFor(static_cast<TokenClass>(style));
}

QColor RobotLexer::defaultPaper(int) const {
    return m_theme.background;
}

void RobotLexer::applyTheme(const Theme& theme) {
    m_theme = theme;
    setDefaultColor(theme.text);
    setDefaultPaper(theme.background);
    for (int i = 0; i < kTokenClassCount; i++) {
        setColor(theme.colorFor(static_cast<TokenClass>(i)), i);
        setPaper(theme.background, i);
    }
}

ScanState RobotLexer::stateAtLine(int line) const {
    QsciScintilla* sci = editor();
    if (!sci || line < 0)
        return {};
    long packed = sci->SendScintilla(QsciScintillaBase::SCI_GETLINESTATE, (unsigned long)line);
    return ScanState::fromInt(static_cast<int>(packed));
}

// ── Styling ──

void RobotLexer::styleText(int start, int end) {
    QsciScintilla* sci = editor();
    if (!sci)
        return;

    int firstLine = static_cast<int>(sci->SendScintilla(
        QsciScintillaBase::SCI_LINEFROMPOSITION, (unsigned long)start));
    int lastLine = static_cast<int>(sci->SendScintilla(
        QsciScintillaBase::SCI_LINEFROMPOSITION, (unsigned long)end));
    int lineCount = sci->lines();

    ScanState state = firstLine > 0 ? stateAtLine(firstLine - 1) : ScanState{};

    // Past the requested range, keep going while the state we hand to the
    // next line differs from what that line was last styled with. A line
    // never styled (stored 0) is left for a later request.
    for (int line = firstLine; line < lineCount; line++) {
        int stored = lineState(sci, line);
        styleLine(sci, line, state);
        if (line < lastLine)
            continue;
        if (stored == state.toInt() || lineState(sci, line + 1) == 0)
            break;
    }
}

void RobotLexer::styleLine(QsciScintilla* sci, int line, ScanState& state) {
    QString text = sci->text(line);
    int eol = text.size();
    while (eol > 0 && (text[eol - 1] == '\n' || text[eol - 1] == '\r'))
        eol--;

    const QString content = text.left(eol);
    LineResult r = m_tokenizer.tokenizeLine(content, state);

    // Re-encoded lengths can exceed the stored bytes (invalid UTF-8 comes
    // back as U+FFFD), so clamp to the line's extent in the document.
    long pos = sci->SendScintilla(QsciScintillaBase::SCI_POSITIONFROMLINE, (unsigned long)line);
    long next = line + 1 < sci->lines()
        ? sci->SendScintilla(QsciScintillaBase::SCI_POSITIONFROMLINE, (unsigned long)(line + 1))
        : sci->SendScintilla(QsciScintillaBase::SCI_GETLENGTH);
    int remaining = static_cast<int>(next - pos);

    startStyling(static_cast<int>(pos));
    for (const Token& t : r.tokens) {
        int n = qMin(byteLength(sci, content.mid(t.start, t.length())), remaining);
        if (n <= 0)
            break;
        setStyling(n, styleFor(t.cls));
        remaining -= n;
    }
    if (remaining > 0)
        setStyling(remaining, styleFor(TokenClass::Plain));  // EOL

    sci->SendScintilla(QsciScintillaBase::SCI_SETLINESTATE,
                       (unsigned long)line, (long)r.state.toInt());
    state = r.state;
}

int RobotLexer::lineState(QsciScintilla* sci, int line) const {
    return static_cast<int>(sci->SendScintilla(
        QsciScintillaBase::SCI_GETLINESTATE, (unsigned long)line));
}

int RobotLexer::byteLength(QsciScintilla* sci, const QString& s) const {
    return static_cast<int>(sci->isUtf8() ? s.toUtf8().size() : s.toLatin1().size());
}

} // namespace rfl
