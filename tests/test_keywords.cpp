#include "keywords.h"
#include <QTest>
#include <QRegularExpression>
#include <QTemporaryFile>

using namespace rfl;

class TestKeywords : public QObject {
    Q_OBJECT
private slots:
    // -- Builtin table --

    void builtinLibraries_data() {
        QTest::addColumn<QString>("phrase");
        QTest::addColumn<QString>("library");
        QTest::newRow("builtin")     << "should be equal as strings" << "BuiltIn";
        QTest::newRow("builtin-log") << "log"                        << "BuiltIn";
        QTest::newRow("string")      << "convert to upper case"      << "String";
        QTest::newRow("collections") << "append to list"             << "Collections";
        QTest::newRow("datetime")    << "get current date"           << "DateTime";
        QTest::newRow("os")          << "create directory"           << "OperatingSystem";
        QTest::newRow("process")     << "run process"                << "Process";
        QTest::newRow("telnet")      << "read until prompt"          << "Telnet";
        QTest::newRow("xml")         << "parse xml"                  << "XML";
        QTest::newRow("screenshot")  << "take screenshot"            << "Screenshot";
        QTest::newRow("dialogs")     << "pause execution"            << "Dialogs";
    }
    void builtinLibraries() {
        QFETCH(QString, phrase);
        QFETCH(QString, library);
        const KeywordDictionary& dict = KeywordDictionary::builtin();
        QVERIFY(dict.contains(phrase));
        QCOMPARE(dict.libraryOf(phrase), library);
    }

    void builtinIsShared() {
        QCOMPARE(&KeywordDictionary::builtin(), &KeywordDictionary::builtin());
    }

    void builtinLibraryOrder() {
        QCOMPARE(KeywordDictionary::builtin().libraries(),
                 QStringList({"BuiltIn", "String", "Collections", "DateTime", "OperatingSystem",
                              "Process", "Telnet", "XML", "Screenshot", "Dialogs"}));
        QVERIFY(KeywordDictionary::builtin().size() > 300);
    }

    void builtinEntriesAreNormalized() {
        for (const KeywordEntry& e : KeywordDictionary::builtinEntries())
            QCOMPARE(KeywordDictionary::normalize(e.name), e.name);
    }

    // -- Lookup --

    void lookupExpectsNormalizedPhrase() {
        const KeywordDictionary& dict = KeywordDictionary::builtin();
        QVERIFY(!dict.contains("Should Be Equal"));
        QVERIFY(!dict.contains("should  be equal"));
        QVERIFY(dict.contains(KeywordDictionary::normalize("  Should   Be\tEqual ")));
        QVERIFY(!dict.contains("should be"));
        QVERIFY(dict.libraryOf("no such keyword").isEmpty());
    }

    void normalize() {
        QCOMPARE(KeywordDictionary::normalize("  Log   To\tConsole  "), QString("log to console"));
        QCOMPARE(KeywordDictionary::normalize("SLEEP"), QString("sleep"));
        QCOMPARE(KeywordDictionary::normalize("   "), QString());
    }

    void maxWordsFor() {
        KeywordDictionary dict({{"BuiltIn", "should be equal"},
                                {"BuiltIn", "should be equal as strings"},
                                {"BuiltIn", "sleep"}});
        QCOMPARE(dict.maxWordsFor("should"), 5);
        QCOMPARE(dict.maxWordsFor("sleep"), 1);
        QCOMPARE(dict.maxWordsFor("nope"), 0);
        QCOMPARE(dict.size(), 3);
    }

    void firstClaimWins() {
        KeywordDictionary dict({{"First", "open thing"}, {"Second", "open thing"},
                                {"Second", "close thing"}});
        QCOMPARE(dict.size(), 2);
        QCOMPARE(dict.libraryOf("open thing"), QString("First"));
        QCOMPARE(dict.libraryOf("close thing"), QString("Second"));
        QCOMPARE(dict.libraries(), QStringList({"First", "Second"}));
    }

    void extensionCannotClaimBuiltinName() {
        QVector<KeywordEntry> entries = KeywordDictionary::builtinEntries();
        entries.append({"SeleniumLibrary", "log"});
        entries.append({"SeleniumLibrary", "open browser"});
        KeywordDictionary dict(entries);
        QCOMPARE(dict.libraryOf("log"), QString("BuiltIn"));
        QCOMPARE(dict.libraryOf("open browser"), QString("SeleniumLibrary"));
        QCOMPARE(dict.libraries().last(), QString("SeleniumLibrary"));
    }

    void emptyDictionary() {
        KeywordDictionary dict;
        QVERIFY(dict.isEmpty());
        QVERIFY(!dict.contains("log"));
        QCOMPARE(dict.maxWordsFor("log"), 0);
    }

    // -- Extension files --

    void parseValid() {
        QVector<KeywordEntry> out;
        KeywordLoadResult r = KeywordDictionary::parseEntries(
            R"({"libraries": {"SeleniumLibrary": ["Open  Browser", "Click Element"],
                              "RequestsLibrary": ["GET On Session"]}})", out);
        QVERIFY(r.ok);
        QCOMPARE(r.added, 3);
        QCOMPARE(out.size(), 3);

        KeywordDictionary dict(out);
        QCOMPARE(dict.libraryOf("open browser"), QString("SeleniumLibrary"));
        QCOMPARE(dict.libraryOf("get on session"), QString("RequestsLibrary"));
    }

    void parseAppends() {
        QVector<KeywordEntry> out = {{"Mine", "do it"}};
        KeywordLoadResult r = KeywordDictionary::parseEntries(R"({"libraries": {"X": ["Y"]}})", out);
        QVERIFY(r.ok);
        QCOMPARE(out.size(), 2);
        QCOMPARE(out[0].name, QString("do it"));
        QCOMPARE(out[1].library, QString("X"));
    }

    void parseSkipsInvalidItems() {
        QVector<KeywordEntry> out;
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Skipping invalid entry"));
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Skipping invalid entry"));
        KeywordLoadResult r = KeywordDictionary::parseEntries(
            R"({"libraries": {"Lib": ["Click", 42, "   "]}})", out);
        QVERIFY(r.ok);
        QCOMPARE(r.added, 1);
        QCOMPARE(out.size(), 1);
        QCOMPARE(out[0].name, QString("click"));
    }

    void parseErrors_data() {
        QTest::addColumn<QByteArray>("json");
        QTest::addColumn<QString>("error");
        QTest::newRow("malformed")   << QByteArray("{\"libraries\": ")      << "invalid JSON";
        QTest::newRow("array-root")  << QByteArray("[]")                    << "root must be an object";
        QTest::newRow("no-libs")     << QByteArray("{}")                    << "libraries";
        QTest::newRow("libs-array")  << QByteArray("{\"libraries\": []}")   << "libraries";
        QTest::newRow("not-array")   << QByteArray("{\"libraries\": {\"A\": [\"x\"], \"B\": \"y\"}}")
                                     << "library 'B' must be an array";
    }
    void parseErrors() {
        QFETCH(QByteArray, json);
        QFETCH(QString, error);
        QVector<KeywordEntry> out = {{"Keep", "me"}};
        KeywordLoadResult r = KeywordDictionary::parseEntries(json, out);
        QVERIFY(!r.ok);
        QCOMPARE(r.added, 0);
        QVERIFY2(r.error.contains(error), qPrintable(r.error));
        QCOMPARE(out.size(), 1);
    }

    void loadMissingFile() {
        QVector<KeywordEntry> out;
        KeywordLoadResult r = KeywordDictionary::loadEntries("/nonexistent/keywords.json", out);
        QVERIFY(!r.ok);
        QVERIFY(r.error.startsWith("cannot open"));
        QVERIFY(out.isEmpty());
    }

    void loadFile() {
        QTemporaryFile f;
        QVERIFY(f.open());
        f.write(R"({"libraries": {"SSHLibrary": ["Open Connection", "Execute Command"]}})");
        f.close();

        QVector<KeywordEntry> out;
        KeywordLoadResult r = KeywordDictionary::loadEntries(f.fileName(), out);
        QVERIFY(r.ok);
        QCOMPARE(r.added, 2);
        QCOMPARE(out[0].library, QString("SSHLibrary"));
    }
};

QTEST_GUILESS_MAIN(TestKeywords)
#include "test_keywords.moc"
