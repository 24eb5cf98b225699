#include "keywords.h"
#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <iterator>

namespace rfl {

// ── Standard library keyword table ─────────────────────────────────────

static const char* const kBuiltIn[] = {
    "call method", "catenate", "comment", "continue for loop", "continue for loop if",
    "convert to binary", "convert to boolean", "convert to bytes", "convert to hex",
    "convert to integer", "convert to number", "convert to octal", "convert to string",
    "create dictionary", "create list", "evaluate", "exit for loop", "exit for loop if",
    "fail", "fatal error", "get count", "get length", "get library instance",
    "get time", "get variable value", "get variables", "import library", "import resource",
    "import variables", "keyword should exist", "length should be", "log", "log many",
    "log to console", "log variables", "no operation", "pass execution", "pass execution if",
    "regexp escape", "register keyword to run on failure", "reload library", "remove tags",
    "repeat keyword", "replace variables", "return from keyword", "return from keyword if",
    "run keyword", "run keyword and continue on failure", "run keyword and expect error",
    "run keyword and ignore error", "run keyword and return", "run keyword and return if",
    "run keyword and return status", "run keyword and warn on failure", "run keyword if",
    "run keyword if all critical tests passed", "run keyword if all tests passed",
    "run keyword if any critical tests failed", "run keyword if any tests failed",
    "run keyword if test failed", "run keyword if test passed",
    "run keyword if timeout occurred", "run keyword unless", "run keywords",
    "set global variable", "set library search order", "set log level",
    "set suite documentation", "set suite metadata", "set suite variable",
    "set tags", "set task variable", "set test documentation", "set test message",
    "set test variable", "set variable", "set variable if", "should be empty",
    "should be equal", "should be equal as integers", "should be equal as numbers",
    "should be equal as strings", "should be true", "should contain", "should contain any",
    "should contain x times", "should end with", "should match", "should match regexp",
    "should not be empty", "should not be equal", "should not be equal as integers",
    "should not be equal as numbers", "should not be equal as strings", "should not be true",
    "should not contain", "should not contain any", "should not end with", "should not match",
    "should not match regexp", "should not start with", "should start with", "sleep",
    "variable should exist", "variable should not exist", "wait until keyword succeeds",
    "skip", "skip if",
};

static const char* const kString[] = {
    "convert to lower case", "convert to lowercase", "convert to upper case",
    "convert to uppercase", "decode bytes to string", "encode string to bytes",
    "fetch from left", "fetch from right", "format string", "generate random string",
    "get line", "get line count", "get lines containing string", "get lines matching pattern",
    "get lines matching regexp", "get regexp matches", "get string length", "get substring",
    "remove string", "remove string using regexp", "replace string",
    "replace string using regexp", "should be byte string", "should be lower case",
    "should be lowercase", "should be string", "should be title case", "should be titlecase",
    "should be unicode string", "should be upper case", "should be uppercase",
    "should not be string", "split string", "split string from right",
    "split string to characters", "split to lines", "strip string",
};

static const char* const kCollections[] = {
    "append to list", "combine lists", "convert to dictionary", "convert to list",
    "copy dictionary", "copy list", "count values in list", "dictionaries should be equal",
    "dictionary should contain item", "dictionary should contain key",
    "dictionary should contain sub dictionary", "dictionary should contain value",
    "dictionary should not contain key", "dictionary should not contain value",
    "get dictionary items", "get dictionary keys", "get dictionary values",
    "get from dictionary", "get from list", "get index from list",
    "get match count", "get matches", "get slice from list", "insert into list",
    "keep in dictionary", "list should contain sub list", "list should contain value",
    "list should not contain duplicates", "list should not contain value",
    "lists should be equal", "log dictionary", "log list", "pop from dictionary",
    "remove duplicates", "remove from dictionary", "remove from list",
    "remove values from list", "reverse list", "set list value", "set to dictionary",
    "should contain match", "should not contain match", "sort list",
};

static const char* const kDateTime[] = {
    "add time to date", "add time to time", "convert date", "convert time",
    "get current date", "subtract date from date", "subtract time from date",
    "subtract time from time",
};

static const char* const kOperatingSystem[] = {
    "append to environment variable", "append to file", "copy directory", "copy file",
    "copy files", "count directories in directory", "count files in directory",
    "count items in directory", "create binary file", "create directory", "create file",
    "directory should be empty", "directory should exist", "directory should not be empty",
    "directory should not exist", "empty directory", "environment variable should be set",
    "environment variable should not be set", "file should be empty", "file should exist",
    "file should not be empty", "file should not exist", "get binary file",
    "get environment variable", "get environment variables", "get file", "get file size",
    "get modified time", "grep file", "join path", "join paths",
    "list directories in directory", "list directory", "list files in directory",
    "log environment variables", "log file", "move directory", "move file", "move files",
    "normalize path", "remove directory", "remove environment variable", "remove file",
    "remove files", "run", "run and return rc", "run and return rc and output",
    "set environment variable", "set modified time", "should exist", "should not exist",
    "split extension", "split path", "touch", "wait until created", "wait until removed",
};

static const char* const kProcess[] = {
    "get process id", "get process object", "get process result", "is process running",
    "join command line", "process should be running", "process should be stopped",
    "run process", "send signal to process", "split command line", "start process",
    "stop all processes", "stop process", "switch process", "terminate all processes",
    "terminate process", "wait for process",
};

static const char* const kTelnet[] = {
    "close all connections", "close connection", "execute command", "login",
    "open connection", "read", "read until", "read until prompt", "read until regexp",
    "set default log level", "set encoding", "set newline", "set prompt",
    "set telnetlib log level", "set timeout", "switch connection", "write",
    "write bare", "write control character", "write until expected output",
};

static const char* const kXml[] = {
    "add element", "clear element", "copy element", "element attribute should be",
    "element attribute should match", "element should exist", "element should not exist",
    "element should not have attribute", "element text should be", "element text should match",
    "element to string", "elements should be equal", "elements should match",
    "evaluate xpath", "get child elements", "get element", "get element attribute",
    "get element attributes", "get element count", "get element text", "get elements",
    "get elements texts", "log element", "parse xml", "remove element",
    "remove element attribute", "remove element attributes", "remove elements",
    "remove elements attribute", "remove elements attributes", "save xml",
    "set element attribute", "set element tag", "set element text",
    "set elements attribute", "set elements tag", "set elements text",
};

static const char* const kScreenshot[] = {
    "set screenshot directory", "take screenshot", "take screenshot without embedding",
};

static const char* const kDialogs[] = {
    "execute manual step", "get selection from user", "get value from user", "pause execution",
};

struct LibraryTable {
    const char*        library;
    const char* const* names;
    size_t             count;
};

// Order matters: the first library to list a name owns it.
static const LibraryTable kLibraryTables[] = {
    {"BuiltIn",         kBuiltIn,         std::size(kBuiltIn)},
    {"String",          kString,          std::size(kString)},
    {"Collections",     kCollections,     std::size(kCollections)},
    {"DateTime",        kDateTime,        std::size(kDateTime)},
    {"OperatingSystem", kOperatingSystem, std::size(kOperatingSystem)},
    {"Process",         kProcess,         std::size(kProcess)},
    {"Telnet",          kTelnet,          std::size(kTelnet)},
    {"XML",             kXml,             std::size(kXml)},
    {"Screenshot",      kScreenshot,      std::size(kScreenshot)},
    {"Dialogs",         kDialogs,         std::size(kDialogs)},
};

// ── Construction ───────────────────────────────────────────────────────

KeywordDictionary::KeywordDictionary(const QVector<KeywordEntry>& entries) {
    m_library.reserve(entries.size());
    for (const KeywordEntry& e : entries) {
        if (e.name.isEmpty() || m_library.contains(e.name))
            continue;
        m_library.insert(e.name, e.library);
        if (!m_libraries.contains(e.library))
            m_libraries.append(e.library);

        const QStringList words = e.name.split(QLatin1Char(' '));
        int& longest = m_maxWords[words.first()];
        if (words.size() > longest)
            longest = words.size();
    }
}

QVector<KeywordEntry> KeywordDictionary::builtinEntries() {
    QVector<KeywordEntry> entries;
    for (const LibraryTable& t : kLibraryTables) {
        const QString lib = QString::fromLatin1(t.library);
        for (size_t i = 0; i < t.count; i++)
            entries.append({lib, QString::fromLatin1(t.names[i])});
    }
    return entries;
}

const KeywordDictionary& KeywordDictionary::builtin() {
    static const KeywordDictionary dict(builtinEntries());
    return dict;
}

QString KeywordDictionary::normalize(const QString& phrase) {
    return phrase.simplified().toLower();
}

// ── Extension files ────────────────────────────────────────────────────

KeywordLoadResult KeywordDictionary::parseEntries(const QByteArray& json,
                                                  QVector<KeywordEntry>& out)
{
    QJsonParseError perr;
    QJsonDocument doc = QJsonDocument::fromJson(json, &perr);
    if (perr.error != QJsonParseError::NoError)
        return {false, 0, QStringLiteral("invalid JSON at offset %1: %2")
                              .arg(perr.offset).arg(perr.errorString())};
    if (!doc.isObject())
        return {false, 0, QStringLiteral("root must be an object")};

    QJsonValue libsVal = doc.object().value(QStringLiteral("libraries"));
    if (!libsVal.isObject())
        return {false, 0, QStringLiteral("missing \"libraries\" object")};
    QJsonObject libs = libsVal.toObject();

    // Validate every library before touching `out`
    for (auto it = libs.constBegin(); it != libs.constEnd(); ++it) {
        if (!it.value().isArray())
            return {false, 0, QStringLiteral("library '%1' must be an array").arg(it.key())};
    }

    int added = 0;
    for (auto it = libs.constBegin(); it != libs.constEnd(); ++it) {
        const QJsonArray names = it.value().toArray();
        for (const QJsonValue& v : names) {
            QString name = v.isString() ? normalize(v.toString()) : QString();
            if (name.isEmpty()) {
                qWarning() << "KeywordDictionary: Skipping invalid entry in library" << it.key();
                continue;
            }
            out.append({it.key(), name});
            added++;
        }
    }
    return {true, added, {}};
}

KeywordLoadResult KeywordDictionary::loadEntries(const QString& path, QVector<KeywordEntry>& out) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return {false, 0, QStringLiteral("cannot open '%1': %2").arg(path, f.errorString())};

    KeywordLoadResult r = parseEntries(f.readAll(), out);
    if (r.ok)
        qDebug() << "KeywordDictionary: Loaded" << r.added << "keywords from" << path;
    return r;
}

} // namespace rfl
