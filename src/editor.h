#pragma once
#include "tokenizer.h"
#include "themes/theme.h"
#include <QWidget>

class QsciScintilla;

namespace rfl {

class KeywordDictionary;
class RobotLexer;

class RobotEditor : public QWidget {
    Q_OBJECT
public:
    explicit RobotEditor(const KeywordDictionary& dict, QWidget* parent = nullptr);
    ~RobotEditor() override;

    bool loadFile(const QString& path, QString* error = nullptr);
    void setText(const QString& text);
    QString text() const;
    QString filePath() const { return m_path; }

    QsciScintilla* scintilla() const { return m_sci; }
    RobotLexer* lexer() const { return m_lexer; }

    // Section in effect at the end of `line`. Styles up to that line first.
    Section sectionAtLine(int line) const;

    void setEditorFont(const QString& fontName);
    static void setGlobalFontName(const QString& fontName);
    void applyTheme(const Theme& theme);

signals:
    void sectionChanged(rfl::Section section);

private:
    QsciScintilla* m_sci   = nullptr;
    RobotLexer*    m_lexer = nullptr;
    QString        m_path;
    Section        m_caretSection = Section::None;

    void setupScintilla();
    void setupLexer(const KeywordDictionary& dict);
    void setupMargins();
    void updateMarginWidth();
    void updateCaretSection();
};

} // namespace rfl
