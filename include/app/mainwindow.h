#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>

class MeasureCanvas;
class SessionStore;
class GdalImageProvider;
class QUndoStack;
class QLabel;
class QDockWidget;
class QListWidget;
class QListWidgetItem;
class QAction;
class QToolBar;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow();

    SessionStore* store() const { return m_store; }
    MeasureCanvas* canvas() const { return m_canvas; }

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void openImages();
    void openImageFolder();
    void openProject();
    void saveProject();
    void newProject();
    void saveAnnotatedCurrent();
    void saveAnnotatedAll();
    void addDroppedPaths(const QStringList& paths);
    void showScaleInput(double pixels, const QString& suggestedUnit);
    void refreshPanels();
    void onResultItemClicked(QListWidgetItem* item);
    void onSessionItemClicked(QListWidgetItem* item);
    void deleteSelectedResult();
    void showKeyboardShortcuts();

private:
    void setupMenus();
    void setupToolbar();
    void setupStatusBar();
    void setupResultsPanel();
    void setupSessionPanel();
    void updateActionStates();

    GdalImageProvider* m_provider{nullptr};
    SessionStore* m_store{nullptr};
    QUndoStack* m_undoStack{nullptr};
    MeasureCanvas* m_canvas{nullptr};

    QLabel* m_modeLabel{nullptr};
    QLabel* m_scaleLabel{nullptr};
    QLabel* m_averageLabel{nullptr};
    QLabel* m_roundingLabel{nullptr};
    QLabel* m_snapLabel{nullptr};

    // Dockable panels
    QDockWidget* m_resultsDock{nullptr};
    QDockWidget* m_sessionDock{nullptr};
    QListWidget* m_resultsList{nullptr};
    QListWidget* m_sessionList{nullptr};

    QToolBar* m_toolbar{nullptr};
    QAction* m_measureAction{nullptr};
    QAction* m_scaleAction{nullptr};
    QAction* m_continuousAction{nullptr};
    QAction* m_snapAction{nullptr};
    QAction* m_ceilAction{nullptr};
};

#endif // MAINWINDOW_H
