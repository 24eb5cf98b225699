#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QHash>
#include <QByteArray>

namespace rfl {

struct KeywordEntry {
    QString library;
    QString name;       // normalized: lowercase, single spaces
};

struct KeywordLoadResult {
    bool ok;
    int added;
    QString error;
};

// ── Keyword Dictionary ─────────────────────────────────────────────────
//
// Flat, immutable lookup of library keyword names. Phrases are stored
// normalized; callers look up normalized phrases. Built once from an entry
// list and never modified afterwards, so one instance can be shared by
// any number of tokenizers.

class KeywordDictionary {
public:
    KeywordDictionary() = default;
    explicit KeywordDictionary(const QVector<KeywordEntry>& entries);

    // Process-wide dictionary holding the standard library table.
    static const KeywordDictionary& builtin();
    static QVector<KeywordEntry> builtinEntries();

    // Extension file: { "libraries": { "Lib": ["Name", ...] } }
    static KeywordLoadResult parseEntries(const QByteArray& json, QVector<KeywordEntry>& out);
    static KeywordLoadResult loadEntries(const QString& path, QVector<KeywordEntry>& out);

    static QString normalize(const QString& phrase);

    bool contains(const QString& phrase) const { return m_library.contains(phrase); }
    QString libraryOf(const QString& phrase) const { return m_library.value(phrase); }

    // Longest phrase (in words) starting with firstWord, 0 if none.
    int maxWordsFor(const QString& firstWord) const { return m_maxWords.value(firstWord, 0); }

    int size() const { return m_library.size(); }
    bool isEmpty() const { return m_library.isEmpty(); }
    QStringList libraries() const { return m_libraries; }

private:
    QHash<QString, QString> m_library;   // phrase -> first claiming library
    QHash<QString, int>     m_maxWords;  // first word -> longest phrase word count
    QStringList             m_libraries;
};

} // namespace rfl
