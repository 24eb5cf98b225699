#include "theme.h"
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <type_traits>

namespace rfl {

// ── Shared field metadata (serialization) ──

const ThemeFieldMeta kThemeFields[] = {
    {"background",        &Theme::background},
    {"margin",            &Theme::margin},
    {"marginText",        &Theme::marginText},
    {"caretLine",         &Theme::caretLine},
    {"selection",         &Theme::selection},
    {"text",              &Theme::text},
    {"syntaxHeading",     &Theme::syntaxHeading},
    {"syntaxComment",     &Theme::syntaxComment},
    {"syntaxDefinition",  &Theme::syntaxDefinition},
    {"syntaxVariable",    &Theme::syntaxVariable},
    {"syntaxMeta",        &Theme::syntaxMeta},
    {"syntaxKeyword",     &Theme::syntaxKeyword},
    {"syntaxFunction",    &Theme::syntaxFunction},
    {"syntaxString",      &Theme::syntaxString},
    {"syntaxNumber",      &Theme::syntaxNumber},
    {"syntaxAttribute",   &Theme::syntaxAttribute},
    {"syntaxPunctuation", &Theme::syntaxPunctuation},
};
const int kThemeFieldCount = static_cast<int>(std::extent_v<decltype(kThemeFields)>);

QColor Theme::colorFor(TokenClass cls) const {
    switch (cls) {
    case TokenClass::Heading:       return syntaxHeading;
    case TokenClass::Comment:       return syntaxComment;
    case TokenClass::Definition:    return syntaxDefinition;
    case TokenClass::VariableName:  return syntaxVariable;
    case TokenClass::Meta:          return syntaxMeta;
    case TokenClass::Keyword:       return syntaxKeyword;
    case TokenClass::Function:      return syntaxFunction;
    case TokenClass::String:        return syntaxString;
    case TokenClass::Number:        return syntaxNumber;
    case TokenClass::AttributeName: return syntaxAttribute;
    case TokenClass::Punctuation:   return syntaxPunctuation;
    case TokenClass::Plain:         break;
    }
    return text;
}

QJsonObject Theme::toJson() const {
    QJsonObject o;
    o["name"] = name;
    for (int i = 0; i < kThemeFieldCount; i++)
        o[kThemeFields[i].key] = (this->*kThemeFields[i].ptr).name();
    return o;
}

Theme Theme::fromJson(const QJsonObject& o) {
    // Start from dark so that absent or unparsable keys keep a usable color
    Theme t = dark();
    t.name = o["name"].toString("Untitled");
    for (int i = 0; i < kThemeFieldCount; i++) {
        if (!o.contains(kThemeFields[i].key))
            continue;
        QColor c(o[kThemeFields[i].key].toString());
        if (c.isValid())
            t.*kThemeFields[i].ptr = c;
        else
            qWarning() << "Theme: Invalid color for" << kThemeFields[i].key << "in" << t.name;
    }
    return t;
}

// ── Builtins ──

Theme Theme::dark() {
    Theme t;
    t.name              = "dark";
    t.background        = QColor("#1e1e1e");
    t.margin            = QColor("#252526");
    t.marginText        = QColor("#858585");
    t.caretLine         = QColor("#2a2d2e");
    t.selection         = QColor("#264f78");
    t.text              = QColor("#d4d4d4");
    t.syntaxHeading     = QColor("#569cd6");
    t.syntaxComment     = QColor("#6a9955");
    t.syntaxDefinition  = QColor("#dcdcaa");
    t.syntaxVariable    = QColor("#9cdcfe");
    t.syntaxMeta        = QColor("#c586c0");
    t.syntaxKeyword     = QColor("#569cd6");
    t.syntaxFunction    = QColor("#4ec9b0");
    t.syntaxString      = QColor("#ce9178");
    t.syntaxNumber      = QColor("#b5cea8");
    t.syntaxAttribute   = QColor("#9cdcfe");
    t.syntaxPunctuation = QColor("#505050");
    return t;
}

Theme Theme::warm() {
    Theme t;
    t.name              = "warm";
    t.background        = QColor("#2b2420");
    t.margin            = QColor("#322a25");
    t.marginText        = QColor("#8a7a6e");
    t.caretLine         = QColor("#3a302a");
    t.selection         = QColor("#5a4636");
    t.text              = QColor("#e6d5c3");
    t.syntaxHeading     = QColor("#e0a458");
    t.syntaxComment     = QColor("#7f8c5a");
    t.syntaxDefinition  = QColor("#f2c57c");
    t.syntaxVariable    = QColor("#d9a38c");
    t.syntaxMeta        = QColor("#c98bb9");
    t.syntaxKeyword     = QColor("#e07a5f");
    t.syntaxFunction    = QColor("#81b29a");
    t.syntaxString      = QColor("#d4a945");
    t.syntaxNumber      = QColor("#b8c480");
    t.syntaxAttribute   = QColor("#d9a38c");
    t.syntaxPunctuation = QColor("#5e5048");
    return t;
}

QStringList Theme::builtinNames() {
    return {QStringLiteral("dark"), QStringLiteral("warm")};
}

Theme Theme::byName(const QString& name, bool* ok) {
    if (ok) *ok = true;
    if (name.compare(QLatin1String("warm"), Qt::CaseInsensitive) == 0)
        return warm();
    if (name.compare(QLatin1String("dark"), Qt::CaseInsensitive) != 0 && ok)
        *ok = false;
    return dark();
}

bool Theme::loadFile(const QString& path, Theme& out, QString* error) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        if (error) *error = QStringLiteral("cannot open '%1': %2").arg(path, f.errorString());
        return false;
    }
    QJsonParseError perr;
    QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) *error = QStringLiteral("'%1' is not a theme object").arg(path);
        return false;
    }
    out = fromJson(doc.object());
    return true;
}

} // namespace rfl
