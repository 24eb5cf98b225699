#include "mainwindow.h"
#include "keywords.h"
#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QFileDialog>
#include <QFileInfo>
#include <QMessageBox>
#include <QMenuBar>
#include <QStatusBar>
#include <QLabel>
#include <QAction>
#include <QActionGroup>
#include <QSettings>

namespace rfl {

MainWindow::MainWindow(const KeywordDictionary& dict, QWidget* parent)
    : QMainWindow(parent)
{
    m_editor = new RobotEditor(dict, this);
    setCentralWidget(m_editor);

    m_sectionLabel = new QLabel(this);
    m_dictLabel = new QLabel(QStringLiteral("%1 keywords from %2 libraries")
                                 .arg(dict.size()).arg(dict.libraries().size()), this);
    statusBar()->addWidget(m_sectionLabel, 1);
    statusBar()->addPermanentWidget(m_dictLabel);

    connect(m_editor, &RobotEditor::sectionChanged, this, &MainWindow::showSection);
    showSection(Section::None);

    createMenus();
    updateTitle();
}

void MainWindow::createMenus() {
    QMenu* file = menuBar()->addMenu("&File");
    QAction* open = file->addAction("&Open...", this, &MainWindow::openFileDialog);
    open->setShortcut(QKeySequence::Open);
    file->addSeparator();
    QAction* quit = file->addAction("E&xit", this, &QWidget::close);
    quit->setShortcut(QKeySequence::Quit);

    QMenu* view = menuBar()->addMenu("&View");

    QMenu* fonts = view->addMenu("&Font");
    m_fontGroup = new QActionGroup(this);
    m_fontGroup->setExclusive(true);
    const QString savedFont = QSettings("RfLex", "RfLex").value("font", "JetBrains Mono").toString();
    for (const char* family : {"JetBrains Mono", "Consolas", "DejaVu Sans Mono"}) {
        const QString name = QString::fromLatin1(family);
        QAction* act = fonts->addAction(name);
        act->setCheckable(true);
        act->setChecked(name == savedFont);
        m_fontGroup->addAction(act);
        connect(act, &QAction::triggered, this, [this, name]() { setEditorFont(name); });
    }

    QMenu* themes = view->addMenu("&Theme");
    m_themeGroup = new QActionGroup(this);
    const QString current = QSettings("RfLex", "RfLex").value("theme", "dark").toString();
    for (const QString& name : Theme::builtinNames()) {
        QAction* act = themes->addAction(name);
        act->setCheckable(true);
        act->setChecked(name == current);
        m_themeGroup->addAction(act);
        connect(act, &QAction::triggered, this, [this, name]() { selectTheme(name); });
    }
}

bool MainWindow::openFile(const QString& path) {
    QString error;
    if (!m_editor->loadFile(path, &error)) {
        QMessageBox::warning(this, "Open",
                             QStringLiteral("Could not open %1:\n%2").arg(path, error));
        return false;
    }
    QSettings("RfLex", "RfLex").setValue("lastDir", QFileInfo(path).absolutePath());
    updateTitle();
    return true;
}

void MainWindow::openFileDialog() {
    const QString dir = QSettings("RfLex", "RfLex").value("lastDir").toString();
    QString path = QFileDialog::getOpenFileName(
        this, "Open Robot File", dir,
        "Robot Framework (*.robot *.resource *.txt);;All Files (*)");
    if (!path.isEmpty())
        openFile(path);
}

void MainWindow::applyTheme(const Theme& theme) {
    m_editor->applyTheme(theme);
}

void MainWindow::setEditorFont(const QString& fontName) {
    QSettings("RfLex", "RfLex").setValue("font", fontName);
    m_editor->setEditorFont(fontName);
}

void MainWindow::selectTheme(const QString& name) {
    QSettings("RfLex", "RfLex").setValue("theme", name);
    applyTheme(Theme::byName(name));
}

void MainWindow::showSection(Section section) {
    m_sectionLabel->setText(QStringLiteral("Section: %1").arg(QLatin1String(sectionName(section))));
}

void MainWindow::updateTitle() {
    const QString path = m_editor->filePath();
    setWindowTitle(path.isEmpty() ? QStringLiteral("RfLex")
                                  : QStringLiteral("%1 - RfLex").arg(QFileInfo(path).fileName()));
}

} // namespace rfl

// ── Entry point ──

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("RfLex");
    app.setOrganizationName("RfLex");
    app.setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Robot Framework syntax viewer");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption keywordsOpt({"k", "keywords"},
        "JSON file with extra library keywords.", "file");
    QCommandLineOption themeOpt({"t", "theme"},
        "Builtin theme name or theme JSON file.", "theme");
    parser.addOption(keywordsOpt);
    parser.addOption(themeOpt);
    parser.addPositionalArgument("file", "Robot file to open.");
    parser.process(app);

    QSettings settings("RfLex", "RfLex");

    // Dictionary: builtin table plus optional extension file
    QVector<rfl::KeywordEntry> entries = rfl::KeywordDictionary::builtinEntries();
    const QString kwPath = parser.isSet(keywordsOpt)
        ? parser.value(keywordsOpt) : settings.value("keywordFile").toString();
    if (!kwPath.isEmpty()) {
        rfl::KeywordLoadResult r = rfl::KeywordDictionary::loadEntries(kwPath, entries);
        if (!r.ok)
            qWarning() << "Keyword file ignored:" << r.error;
        else if (parser.isSet(keywordsOpt))
            settings.setValue("keywordFile", kwPath);
    }
    const rfl::KeywordDictionary dict(entries);

    rfl::RobotEditor::setGlobalFontName(settings.value("font", "JetBrains Mono").toString());

    // Theme: --theme (file or name), else the saved builtin name
    rfl::Theme theme = rfl::Theme::byName(settings.value("theme", "dark").toString());
    if (parser.isSet(themeOpt)) {
        const QString value = parser.value(themeOpt);
        QString error;
        bool ok = false;
        if (QFileInfo::exists(value))
            ok = rfl::Theme::loadFile(value, theme, &error);
        else
            theme = rfl::Theme::byName(value, &ok);
        if (!ok)
            qWarning() << "Theme" << value << "not usable" << error << "- using" << theme.name;
    }

    rfl::MainWindow window(dict);
    window.applyTheme(theme);
    window.resize(1000, 720);

    const QStringList args = parser.positionalArguments();
    if (!args.isEmpty())
        window.openFile(args.first());

    window.show();
    return app.exec();
}

// MainWindow Q_OBJECT is in mainwindow.h; AUTOMOC handles moc generation.
