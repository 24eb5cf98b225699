// rfl-tokenize: prints the token stream of a Robot Framework file.
//
// Text output, one record per token:
//   <line>:<start>-<end> <class> "<text>"
// With --json, an array with one object per line:
//   {"line": 1, "section": "testcases", "definition": true, "tokens": [...]}

#include "keywords.h"
#include "tokenizer.h"
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>
#include <cstdio>

static QStringList splitLines(const QString& text) {
    QStringList lines = text.split(QLatin1Char('\n'));
    if (!lines.isEmpty() && lines.last().isEmpty())
        lines.removeLast();
    for (QString& l : lines) {
        if (l.endsWith(QLatin1Char('\r')))
            l.chop(1);
    }
    return lines;
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("rfl-tokenize");
    app.setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Dump the token stream of a Robot Framework file");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption jsonOpt("json", "Emit JSON instead of text records.");
    QCommandLineOption keywordsOpt({"k", "keywords"},
        "JSON file with extra library keywords.", "file");
    parser.addOption(jsonOpt);
    parser.addOption(keywordsOpt);
    parser.addPositionalArgument("file", "Input file, or - for stdin.");
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    const QString path = args.isEmpty() ? QStringLiteral("-") : args.first();

    QFile in;
    bool opened = false;
    if (path == "-") {
        opened = in.open(stdin, QIODevice::ReadOnly);
    } else {
        in.setFileName(path);
        opened = in.open(QIODevice::ReadOnly);
    }
    if (!opened) {
        fprintf(stderr, "[rfl-tokenize] Cannot read %s: %s\n",
                path.toUtf8().constData(), in.errorString().toUtf8().constData());
        return 1;
    }
    const QStringList lines = splitLines(QString::fromUtf8(in.readAll()));

    QVector<rfl::KeywordEntry> entries = rfl::KeywordDictionary::builtinEntries();
    if (parser.isSet(keywordsOpt)) {
        rfl::KeywordLoadResult r =
            rfl::KeywordDictionary::loadEntries(parser.value(keywordsOpt), entries);
        if (!r.ok) {
            fprintf(stderr, "[rfl-tokenize] Bad keyword file: %s\n", r.error.toUtf8().constData());
            return 1;
        }
    }
    const rfl::KeywordDictionary dict(entries);
    const rfl::LineTokenizer tokenizer(dict);
    const QVector<rfl::LineResult> results = tokenizer.tokenizeLines(lines);

    QTextStream out(stdout);
    if (parser.isSet(jsonOpt)) {
        QJsonArray doc;
        for (int i = 0; i < results.size(); i++) {
            QJsonArray tokens;
            for (const rfl::Token& t : results[i].tokens) {
                QJsonObject o;
                o["class"] = QLatin1String(rfl::tokenClassName(t.cls));
                o["start"] = t.start;
                o["end"]   = t.end;
                o["text"]  = lines[i].mid(t.start, t.length());
                tokens.append(o);
            }
            QJsonObject line;
            line["line"]       = i + 1;
            line["section"]    = QLatin1String(rfl::sectionName(results[i].state.section));
            line["definition"] = results[i].state.definitionLine;
            line["tokens"]     = tokens;
            doc.append(line);
        }
        out << QJsonDocument(doc).toJson(QJsonDocument::Indented);
        return 0;
    }

    for (int i = 0; i < results.size(); i++) {
        for (const rfl::Token& t : results[i].tokens) {
            out << (i + 1) << ':' << t.start << '-' << t.end << ' '
                << rfl::tokenClassName(t.cls) << " \""
                << lines[i].mid(t.start, t.length()) << "\"\n";
        }
    }
    return 0;
}
