#pragma once
#include "editor.h"
#include "themes/theme.h"
#include <QMainWindow>

class QLabel;
class QActionGroup;

namespace rfl {

class KeywordDictionary;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(const KeywordDictionary& dict, QWidget* parent = nullptr);

    bool openFile(const QString& path);
    void applyTheme(const Theme& theme);
    void setEditorFont(const QString& fontName);
    RobotEditor* editor() const { return m_editor; }

private slots:
    void openFileDialog();
    void selectTheme(const QString& name);
    void showSection(rfl::Section section);

private:
    RobotEditor*  m_editor       = nullptr;
    QLabel*       m_sectionLabel = nullptr;
    QLabel*       m_dictLabel    = nullptr;
    QActionGroup* m_themeGroup   = nullptr;
    QActionGroup* m_fontGroup    = nullptr;

    void createMenus();
    void updateTitle();
};

} // namespace rfl
