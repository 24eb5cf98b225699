#pragma once
#include "tokenizer.h"
#include "themes/theme.h"
#include <Qsci/qscilexercustom.h>

class QsciScintilla;

namespace rfl {

class KeywordDictionary;

// QScintilla lexer driving LineTokenizer. Style numbers are the TokenClass
// values. The ScanState left by each line is kept in the editor's
// line-state slot, so restyling can start at any line.
class RobotLexer : public QsciLexerCustom {
    Q_OBJECT
public:
    explicit RobotLexer(const KeywordDictionary& dict, QObject* parent = nullptr);
    ~RobotLexer() override;

    const char* language() const override;
    QString description(int style) const override;
    QColor defaultColor(int style) const override;
    QColor defaultPaper(int style) const override;
    void styleText(int start, int end) override;

    void applyTheme(const Theme& theme);
    const Theme& theme() const { return m_theme; }

    // State after `line` as last styled; default state if never styled.
    ScanState stateAtLine(int line) const;

    static int styleFor(TokenClass cls) { return static_cast<int>(cls); }

private:
    LineTokenizer m_tokenizer;
    Theme m_theme;

    void styleLine(QsciScintilla* sci, int line, ScanState& state);
    int lineState(QsciScintilla* sci, int line) const;
    int byteLength(QsciScintilla* sci, const QString& s) const;
};

} // namespace rfl
