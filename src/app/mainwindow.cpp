#include "app/mainwindow.h"
#include "app/scaleinputdialog.h"
#include "canvas/measurecanvas.h"
#include "gdal/gdalimageprovider.h"
#include "sessionstore.h"
#include "imagefiles.h"
#include "appsettings.h"
#include "lengthformatter.h"

#include <QApplication>
#include <QClipboard>
#include <QMenuBar>
#include <QMenu>
#include <QToolBar>
#include <QStatusBar>
#include <QLabel>
#include <QDockWidget>
#include <QListWidget>
#include <QListWidgetItem>
#include <QUndoStack>
#include <QFileDialog>
#include <QFileInfo>
#include <QMessageBox>
#include <QCloseEvent>
#include <QKeySequence>
#include <QTimer>
#include <QDir>
#include <QSettings>

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
{
    setWindowTitle("Sokucho");
    resize(1280, 820);

    m_provider = new GdalImageProvider();
    m_undoStack = new QUndoStack(this);
    m_store = new SessionStore(m_provider, this);
    m_store->setUndoStack(m_undoStack);

    m_canvas = new MeasureCanvas(m_store, this);
    setCentralWidget(m_canvas);

    setupMenus();
    setupToolbar();
    setupStatusBar();
    setupSessionPanel();
    setupResultsPanel();

    // Connect signals
    connect(m_store, &SessionStore::changed, this, &MainWindow::refreshPanels);
    connect(m_store, &SessionStore::statusMessage, this, [this](const QString& msg) {
        statusBar()->showMessage(msg, 5000);
    });
    connect(m_store, &SessionStore::clipboardTextReady, this, [](const QString& text) {
        QApplication::clipboard()->setText(text);
    });
    // Queued: the request arrives from inside a mouse event
    connect(m_store, &SessionStore::scaleInputRequested, this, &MainWindow::showScaleInput,
            Qt::QueuedConnection);
    connect(m_store, &SessionStore::snapFeedback, this, [this](const QPointF&) {
        m_snapLabel->setStyleSheet("color: #2ecc71; font-weight: bold;");
        QTimer::singleShot(400, m_snapLabel, [this]() { m_snapLabel->setStyleSheet(QString()); });
    });
    connect(m_canvas, &MeasureCanvas::filesDropped, this, &MainWindow::addDroppedPaths);

    // Restore window layout
    QSettings settings;
    restoreGeometry(settings.value("window/geometry").toByteArray());
    restoreState(settings.value("window/state").toByteArray());

    m_store->restoreAutosaveIfPossible();
    refreshPanels();
    statusBar()->showMessage(m_store->statusText(), 5000);
}

MainWindow::~MainWindow()
{
    // Store goes first, it still refers to the provider
    delete m_store;
    m_store = nullptr;
    delete m_provider;
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    // Flush a pending autosave
    if (m_store->autosaveScheduler()->isPending()) {
        m_store->autosaveScheduler()->cancel();
        m_store->saveAutosaveNow();
    }

    QSettings settings;
    settings.setValue("window/geometry", saveGeometry());
    settings.setValue("window/state", saveState());
    event->accept();
}

void MainWindow::setupMenus()
{
    // File menu
    QMenu* fileMenu = menuBar()->addMenu("&File");

    QAction* openImagesAction = fileMenu->addAction("&Open Images...");
    openImagesAction->setShortcut(QKeySequence("Ctrl+O"));
    connect(openImagesAction, &QAction::triggered, this, &MainWindow::openImages);

    QAction* openFolderAction = fileMenu->addAction("Open Image &Folder...");
    openFolderAction->setShortcut(QKeySequence("Ctrl+Alt+O"));
    connect(openFolderAction, &QAction::triggered, this, &MainWindow::openImageFolder);

    fileMenu->addSeparator();

    QAction* newAction = fileMenu->addAction("&New Project");
    newAction->setShortcut(QKeySequence("Ctrl+Shift+N"));
    connect(newAction, &QAction::triggered, this, &MainWindow::newProject);

    QAction* openProjectAction = fileMenu->addAction("Open &Project...");
    openProjectAction->setShortcut(QKeySequence("Ctrl+Shift+O"));
    connect(openProjectAction, &QAction::triggered, this, &MainWindow::openProject);

    QAction* saveProjectAction = fileMenu->addAction("&Save Project...");
    saveProjectAction->setShortcut(QKeySequence("Ctrl+Shift+S"));
    connect(saveProjectAction, &QAction::triggered, this, &MainWindow::saveProject);

    fileMenu->addSeparator();

    QAction* saveImageAction = fileMenu->addAction("Save &Annotated Image...");
    connect(saveImageAction, &QAction::triggered, this, &MainWindow::saveAnnotatedCurrent);

    QAction* saveAllImagesAction = fileMenu->addAction("Save All Annotated &Images...");
    connect(saveAllImagesAction, &QAction::triggered, this, &MainWindow::saveAnnotatedAll);

    fileMenu->addSeparator();

    QAction* exitAction = fileMenu->addAction("E&xit");
    exitAction->setShortcut(QKeySequence::Quit);
    connect(exitAction, &QAction::triggered, this, &QWidget::close);

    // Edit menu
    QMenu* editMenu = menuBar()->addMenu("&Edit");

    QAction* undoAction = m_undoStack->createUndoAction(this, "&Undo");
    undoAction->setShortcut(QKeySequence("Ctrl+Z"));
    editMenu->addAction(undoAction);

    QAction* redoAction = m_undoStack->createRedoAction(this, "&Redo");
    redoAction->setShortcut(QKeySequence("Ctrl+Shift+Z"));
    editMenu->addAction(redoAction);

    editMenu->addSeparator();

    QAction* copyAction = editMenu->addAction("&Copy Results (TSV)");
    copyAction->setShortcut(QKeySequence("Ctrl+K"));
    connect(copyAction, &QAction::triggered, this, [this]() { m_store->copyCurrentCsv(); });

    QAction* copyAllAction = editMenu->addAction("Copy &All Results (TSV)");
    copyAllAction->setShortcut(QKeySequence("Ctrl+Shift+K"));
    connect(copyAllAction, &QAction::triggered, this, [this]() { m_store->copyAllCsv(); });

    editMenu->addSeparator();

    QAction* cancelAction = editMenu->addAction("Cancel / Remove Last");
    cancelAction->setShortcut(QKeySequence(Qt::Key_Escape));
    connect(cancelAction, &QAction::triggered, this, [this]() { m_store->cancelAction(); });

    QAction* clearAction = editMenu->addAction("C&lear Measurements");
    connect(clearAction, &QAction::triggered, this, [this]() {
        if (m_store->currentResults().isEmpty()) return;
        if (QMessageBox::question(this, "Clear Measurements",
                "Remove all measurements of the current image?") == QMessageBox::Yes) {
            m_store->clearMeasurements();
        }
    });

    // Measure menu
    QMenu* measureMenu = menuBar()->addMenu("&Measure");

    m_measureAction = measureMenu->addAction("&Measure Mode");
    m_measureAction->setCheckable(true);
    m_measureAction->setShortcut(QKeySequence(Qt::Key_M));
    connect(m_measureAction, &QAction::triggered, this, [this]() {
        m_store->setMode(m_store->mode() == MeasureMode::Measure ? MeasureMode::Idle
                                                                 : MeasureMode::Measure);
    });

    m_scaleAction = measureMenu->addAction("&Scale Mode");
    m_scaleAction->setCheckable(true);
    m_scaleAction->setShortcut(QKeySequence(Qt::Key_S));
    connect(m_scaleAction, &QAction::triggered, this, [this]() {
        m_store->setMode(MeasureMode::Scale);
        statusBar()->showMessage("Scale: click two points of known distance", 5000);
    });

    measureMenu->addSeparator();

    m_continuousAction = measureMenu->addAction("&Continuous Measurement");
    m_continuousAction->setCheckable(true);
    m_continuousAction->setShortcut(QKeySequence(Qt::Key_C));
    connect(m_continuousAction, &QAction::triggered, this, [this](bool on) {
        m_store->setContinuousMeasure(on);
    });

    m_snapAction = measureMenu->addAction("Edge S&nap");
    m_snapAction->setCheckable(true);
    m_snapAction->setShortcut(QKeySequence(Qt::Key_G));
    connect(m_snapAction, &QAction::triggered, this, [this](bool on) {
        m_store->setEdgeSnap(on);
    });

    m_ceilAction = measureMenu->addAction("&Round Up Lengths");
    m_ceilAction->setCheckable(true);
    connect(m_ceilAction, &QAction::triggered, this, [this](bool on) {
        m_store->setRoundingMode(on ? RoundingMode::Ceil : RoundingMode::Round);
    });

    // View menu
    QMenu* viewMenu = menuBar()->addMenu("&View");

    QAction* resetAction = viewMenu->addAction("&Reset View");
    resetAction->setShortcut(QKeySequence(Qt::Key_R));
    connect(resetAction, &QAction::triggered, this, [this]() { m_store->resetView(); });

    QAction* prevAction = viewMenu->addAction("&Previous Image");
    prevAction->setShortcut(QKeySequence("Ctrl+Left"));
    connect(prevAction, &QAction::triggered, this, [this]() { m_store->switchSession(-1); });

    QAction* nextAction = viewMenu->addAction("&Next Image");
    nextAction->setShortcut(QKeySequence("Ctrl+Right"));
    connect(nextAction, &QAction::triggered, this, [this]() { m_store->switchSession(1); });

    // Help menu
    QMenu* helpMenu = menuBar()->addMenu("&Help");
    QAction* shortcutsAction = helpMenu->addAction("&Keyboard Shortcuts");
    connect(shortcutsAction, &QAction::triggered, this, &MainWindow::showKeyboardShortcuts);
}

void MainWindow::setupToolbar()
{
    m_toolbar = addToolBar("Main");
    m_toolbar->setObjectName("mainToolbar");
    m_toolbar->setMovable(false);
    m_toolbar->addAction(m_measureAction);
    m_toolbar->addAction(m_scaleAction);
    m_toolbar->addSeparator();
    m_toolbar->addAction(m_continuousAction);
    m_toolbar->addAction(m_snapAction);
    m_toolbar->addAction(m_ceilAction);
}

void MainWindow::setupStatusBar()
{
    m_modeLabel = new QLabel(this);
    m_modeLabel->setMinimumWidth(80);
    statusBar()->addPermanentWidget(m_modeLabel);

    m_scaleLabel = new QLabel(this);
    m_scaleLabel->setMinimumWidth(160);
    statusBar()->addPermanentWidget(m_scaleLabel);

    m_averageLabel = new QLabel(this);
    m_averageLabel->setMinimumWidth(140);
    statusBar()->addPermanentWidget(m_averageLabel);

    m_roundingLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_roundingLabel);

    m_snapLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_snapLabel);
}

void MainWindow::setupSessionPanel()
{
    m_sessionDock = new QDockWidget("Images", this);
    m_sessionDock->setObjectName("sessionDock");
    m_sessionList = new QListWidget(m_sessionDock);
    m_sessionDock->setWidget(m_sessionList);
    addDockWidget(Qt::LeftDockWidgetArea, m_sessionDock);

    connect(m_sessionList, &QListWidget::itemClicked, this, &MainWindow::onSessionItemClicked);
}

void MainWindow::setupResultsPanel()
{
    m_resultsDock = new QDockWidget("Results", this);
    m_resultsDock->setObjectName("resultsDock");
    m_resultsList = new QListWidget(m_resultsDock);
    m_resultsList->setContextMenuPolicy(Qt::ActionsContextMenu);

    QAction* deleteAction = new QAction("Delete Measurement", m_resultsList);
    deleteAction->setShortcut(QKeySequence::Delete);
    deleteAction->setShortcutContext(Qt::WidgetShortcut);
    connect(deleteAction, &QAction::triggered, this, &MainWindow::deleteSelectedResult);
    m_resultsList->addAction(deleteAction);

    m_resultsDock->setWidget(m_resultsList);
    addDockWidget(Qt::RightDockWidgetArea, m_resultsDock);

    connect(m_resultsList, &QListWidget::itemClicked, this, &MainWindow::onResultItemClicked);
}

void MainWindow::refreshPanels()
{
    // Sessions
    m_sessionList->blockSignals(true);
    m_sessionList->clear();
    const auto& sessions = m_store->sessions();
    for (int i = 0; i < sessions.size(); ++i) {
        auto* item = new QListWidgetItem(QString("%1. %2 (%3)")
                                             .arg(i + 1)
                                             .arg(sessions[i].name)
                                             .arg(sessions[i].results.size()));
        item->setData(Qt::UserRole, i);
        m_sessionList->addItem(item);
        if (i == m_store->activeIndex()) item->setSelected(true);
    }
    m_sessionList->blockSignals(false);

    // Results of the active session
    m_resultsList->clear();
    for (const auto& m : m_store->currentResults()) {
        auto* item = new QListWidgetItem(QString("#%1  %2").arg(m.id).arg(m_store->formattedLength(m.pixelLength)));
        item->setData(Qt::UserRole, m.id);
        if (m.id == m_store->highlightedId()) {
            QFont f = item->font();
            f.setBold(true);
            item->setFont(f);
        }
        m_resultsList->addItem(item);
    }

    m_modeLabel->setText(m_store->modeText());
    m_scaleLabel->setText(QString("Scale: %1").arg(m_store->scaleText()));
    m_averageLabel->setText(QString("Average: %1").arg(m_store->averageText()));
    m_roundingLabel->setText(AppSettings::roundingModeLabel(m_store->roundingMode()));
    m_snapLabel->setText(m_store->edgeSnap() ? "Snap ON" : "Snap OFF");

    if (const ImageSession* session = m_store->activeSession()) {
        setWindowTitle(QString("Sokucho - %1").arg(session->name));
    } else {
        setWindowTitle("Sokucho");
    }

    updateActionStates();
}

void MainWindow::updateActionStates()
{
    m_measureAction->setChecked(m_store->mode() == MeasureMode::Measure);
    m_scaleAction->setChecked(m_store->mode() == MeasureMode::Scale);
    m_continuousAction->setChecked(m_store->continuousMeasure());
    m_snapAction->setChecked(m_store->edgeSnap());
    m_ceilAction->setChecked(m_store->roundingMode() == RoundingMode::Ceil);
}

void MainWindow::onResultItemClicked(QListWidgetItem* item)
{
    if (!item) return;
    m_store->toggleHighlight(item->data(Qt::UserRole).toInt());
}

void MainWindow::onSessionItemClicked(QListWidgetItem* item)
{
    if (!item) return;
    m_store->activateSession(item->data(Qt::UserRole).toInt());
}

void MainWindow::deleteSelectedResult()
{
    QListWidgetItem* item = m_resultsList->currentItem();
    if (!item) return;
    m_store->deleteMeasurement(item->data(Qt::UserRole).toInt());
}

void MainWindow::openImages()
{
    const QStringList files = QFileDialog::getOpenFileNames(this, "Open Images", QString(),
                                                            ImageFiles::fileFilter());
    if (!files.isEmpty()) {
        m_store->addImageFiles(files);
    }
}

void MainWindow::openImageFolder()
{
    const QString dir = QFileDialog::getExistingDirectory(this, "Open Image Folder");
    if (!dir.isEmpty()) {
        m_store->addImageFolder(dir);
    }
}

void MainWindow::addDroppedPaths(const QStringList& paths)
{
    QStringList files;
    for (const QString& path : paths) {
        const QFileInfo info(path);
        if (info.isDir()) {
            files << ImageFiles::listDirectory(path);
        } else if (ImageFiles::isSupported(path)) {
            files << info.absoluteFilePath();
        }
    }
    if (files.isEmpty()) {
        statusBar()->showMessage("No supported images in the dropped items.", 5000);
        return;
    }
    m_store->addImageFiles(files);
}

void MainWindow::newProject()
{
    if (m_store->sessionCount() > 0
        && QMessageBox::question(this, "New Project",
               "Close all images and start a new project?") != QMessageBox::Yes) {
        return;
    }
    m_store->newProject();
}

void MainWindow::openProject()
{
    const QString filter = QString("Sokucho Project (*.%1);;JSON (*.json)")
                               .arg(AppSettings::projectExtension());
    const QString fileName = QFileDialog::getOpenFileName(this, "Open Project", QString(), filter);
    if (fileName.isEmpty()) return;
    if (!m_store->loadProject(fileName)) {
        QMessageBox::warning(this, "Open Project", m_store->statusText());
    }
}

void MainWindow::saveProject()
{
    if (m_store->sessionCount() == 0) {
        statusBar()->showMessage("Nothing to save.", 5000);
        return;
    }
    const QString filter = QString("Sokucho Project (*.%1)").arg(AppSettings::projectExtension());
    const QString fileName = QFileDialog::getSaveFileName(this, "Save Project",
                                                          m_store->defaultProjectName(), filter);
    if (fileName.isEmpty()) return;
    if (!m_store->saveProject(fileName)) {
        QMessageBox::critical(this, "Error", "Failed to save project");
    }
}

void MainWindow::saveAnnotatedCurrent()
{
    if (!m_store->activeSession()) return;
    if (m_store->currentResults().isEmpty()) {
        statusBar()->showMessage("Nothing to save.", 5000);
        return;
    }
    QString fileName = QFileDialog::getSaveFileName(this, "Save Annotated Image",
                                                    m_store->defaultAnnotatedName(),
                                                    "PNG Image (*.png)");
    if (fileName.isEmpty()) return;
    if (QFileInfo(fileName).suffix().isEmpty()) fileName += ".png";
    m_store->saveAnnotatedCurrent(fileName);
}

void MainWindow::saveAnnotatedAll()
{
    const QString dir = QFileDialog::getExistingDirectory(this, "Save Annotated Images To");
    if (dir.isEmpty()) return;
    m_store->saveAnnotatedAll(dir);
}

void MainWindow::showScaleInput(double pixels, const QString& suggestedUnit)
{
    if (!m_store->hasPendingScale()) return;
    ScaleInputDialog dialog(m_store, pixels, suggestedUnit, this);
    dialog.exec();
}

void MainWindow::showKeyboardShortcuts()
{
    QMessageBox::information(this, "Keyboard Shortcuts",
        "M\tToggle measure mode\n"
        "S\tScale mode\n"
        "R\tReset view\n"
        "Esc\tCancel points / remove last measurement\n"
        "C\tContinuous measurement\n"
        "G\tEdge snap\n"
        "Ctrl+Left/Right\tPrevious / next image\n"
        "Ctrl+K\tCopy results (TSV)\n"
        "Ctrl+Shift+K\tCopy all results (TSV)\n"
        "Ctrl+Z / Ctrl+Shift+Z\tUndo / redo\n"
        "Ctrl+O\tOpen images\n"
        "Ctrl+Alt+O\tOpen image folder\n"
        "Ctrl+Shift+N/O/S\tNew / open / save project\n\n"
        "Left click: pick point, drag: pan, right click: cancel, wheel: zoom");
}
