#pragma once
#include "tokenizer.h"
#include <QColor>
#include <QString>
#include <QStringList>
#include <QJsonObject>

namespace rfl {

struct Theme {
    QString name;

    // ── Chrome ──
    QColor background;      // editor paper
    QColor margin;          // line-number margin bg
    QColor marginText;      // line numbers
    QColor caretLine;       // current line highlight
    QColor selection;       // text selection background
    QColor text;            // caret, plain text

    // ── Syntax (one per token class) ──
    QColor syntaxHeading;
    QColor syntaxComment;
    QColor syntaxDefinition;
    QColor syntaxVariable;
    QColor syntaxMeta;
    QColor syntaxKeyword;
    QColor syntaxFunction;
    QColor syntaxString;
    QColor syntaxNumber;
    QColor syntaxAttribute;
    QColor syntaxPunctuation;

    QColor colorFor(TokenClass cls) const;

    QJsonObject toJson() const;
    static Theme fromJson(const QJsonObject& obj);

    // Builtin by name ("dark", "warm"); unknown names give dark.
    static Theme byName(const QString& name, bool* ok = nullptr);
    static QStringList builtinNames();
    static bool loadFile(const QString& path, Theme& out, QString* error = nullptr);

    static Theme dark();
    static Theme warm();
};

// ── Field metadata (serialization) ──

struct ThemeFieldMeta {
    const char* key;
    QColor Theme::* ptr;
};

extern const ThemeFieldMeta kThemeFields[];
extern const int kThemeFieldCount;

} // namespace rfl
