#include "editor.h"
#include "lexer.h"
#include "keywords.h"
#include <QDebug>
#include <Qsci/qsciscintilla.h>
#include <Qsci/qsciscintillabase.h>
#include <QVBoxLayout>
#include <QFile>
#include <QFont>
#include <QColor>

namespace rfl {

static QString g_fontName = "JetBrains Mono";

static QFont editorFont() {
    QFont f(g_fontName, 11);
    f.setFixedPitch(true);
    f.setStyleHint(QFont::Monospace);
    return f;
}

RobotEditor::RobotEditor(const KeywordDictionary& dict, QWidget* parent) : QWidget(parent) {
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);

    m_sci = new QsciScintilla(this);
    layout->addWidget(m_sci);

    setupScintilla();
    setupLexer(dict);
    setupMargins();

    connect(m_sci, &QsciScintilla::cursorPositionChanged,
            this, [this](int, int) { updateCaretSection(); });
    connect(m_sci, &QsciScintilla::linesChanged,
            this, &RobotEditor::updateMarginWidth);
}

RobotEditor::~RobotEditor() {
}

void RobotEditor::setupScintilla() {
    m_sci->setUtf8(true);
    m_sci->setFont(editorFont());
    m_sci->setWrapMode(QsciScintilla::WrapNone);
    m_sci->setCaretLineVisible(true);

    // Tabs are cell separators; keep them visible as such
    m_sci->setTabWidth(4);
    m_sci->setIndentationsUseTabs(false);
    m_sci->setWhitespaceVisibility(QsciScintilla::WsInvisible);

    m_sci->SendScintilla(QsciScintillaBase::SCI_SETEXTRAASCENT, (long)1);
    m_sci->SendScintilla(QsciScintillaBase::SCI_SETEXTRADESCENT, (long)1);
}

void RobotEditor::setupLexer(const KeywordDictionary& dict) {
    m_lexer = new RobotLexer(dict, m_sci);
    QFont font = editorFont();
    m_lexer->setFont(font);
    for (int i = 0; i < kTokenClassCount; i++)
        m_lexer->setFont(font, i);
    m_sci->setLexer(m_lexer);
    m_sci->setBraceMatching(QsciScintilla::NoBraceMatch);
}

void RobotEditor::setupMargins() {
    m_sci->setMarginsFont(editorFont());

    // Margin 0: line numbers
    m_sci->setMarginType(0, QsciScintilla::NumberMargin);
    m_sci->setMarginLineNumbers(0, true);
    updateMarginWidth();

    // Margins 1/2: unused (no markers, no folding)
    m_sci->setMarginWidth(1, 0);
    m_sci->setMarginWidth(2, 0);
}

void RobotEditor::updateMarginWidth() {
    QString digits = QString::number(qMax(m_sci->lines(), 1));
    m_sci->setMarginWidth(0, QStringLiteral(" %1 ").arg(QString(digits.size(), QLatin1Char('9'))));
}

// ── Document ──

bool RobotEditor::loadFile(const QString& path, QString* error) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        qWarning() << "RobotEditor: Cannot open" << path << ":" << f.errorString();
        if (error) *error = f.errorString();
        return false;
    }
    setText(QString::fromUtf8(f.readAll()));
    m_path = path;
    return true;
}

void RobotEditor::setText(const QString& text) {
    m_path.clear();
    m_sci->setText(text);
    updateCaretSection();
}

QString RobotEditor::text() const {
    return m_sci->text();
}

Section RobotEditor::sectionAtLine(int line) const {
    if (line < 0 || line >= m_sci->lines())
        return Section::None;

    long lineEnd = m_sci->SendScintilla(QsciScintillaBase::SCI_GETLINEENDPOSITION, (unsigned long)line);
    long styled  = m_sci->SendScintilla(QsciScintillaBase::SCI_GETENDSTYLED);
    if (styled < lineEnd)
        m_sci->SendScintilla(QsciScintillaBase::SCI_COLOURISE, (unsigned long)styled, lineEnd);
    return m_lexer->stateAtLine(line).section;
}

void RobotEditor::updateCaretSection() {
    int line = 0, col = 0;
    m_sci->getCursorPosition(&line, &col);
    Section s = sectionAtLine(line);
    if (s == m_caretSection)
        return;
    m_caretSection = s;
    emit sectionChanged(s);
}

// ── Appearance ──

void RobotEditor::applyTheme(const Theme& theme) {
    m_lexer->applyTheme(theme);

    m_sci->setPaper(theme.background);
    m_sci->setColor(theme.text);
    m_sci->setCaretForegroundColor(theme.text);
    m_sci->setCaretLineBackgroundColor(theme.caretLine);
    m_sci->setSelectionBackgroundColor(theme.selection);
    m_sci->setMarginsBackgroundColor(theme.margin);
    m_sci->setMarginsForegroundColor(theme.marginText);

    // Lexer colors are read at setLexer time; re-apply and restyle
    m_sci->setLexer(m_lexer);
    m_sci->SendScintilla(QsciScintillaBase::SCI_COLOURISE, (unsigned long)0, (long)-1);
}

void RobotEditor::setEditorFont(const QString& fontName) {
    g_fontName = fontName;
    QFont f = editorFont();

    m_sci->setFont(f);
    m_lexer->setFont(f);
    for (int i = 0; i < kTokenClassCount; i++)
        m_lexer->setFont(f, i);
    m_sci->setMarginsFont(f);
    updateMarginWidth();
}

void RobotEditor::setGlobalFontName(const QString& fontName) {
    g_fontName = fontName;
}

} // namespace rfl
