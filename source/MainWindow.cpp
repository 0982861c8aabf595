#include "MainWindow.h"
#include "core/BlockStore.h"
#include "core/SelectionController.h"
#include "core/SelectionSession.h"
#include "export/ExportWriter.h"
#include "ui/BlockViewport.h"

#include <QAction>
#include <QFileDialog>
#include <QFileInfo>
#include <QKeySequence>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QSettings>
#include <QStatusBar>
#include <QToolBar>
#include <QDebug>

namespace {
constexpr int kNoticeTimeoutMs = 5000;
constexpr qreal kZoomStep = 1.25;
}

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
    , m_config(SessionConfig::load())
{
    setWindowTitle(tr("BlockCrop"));

    m_viewport = new BlockViewport(this);
    setCentralWidget(m_viewport);
    connect(m_viewport, &BlockViewport::zoomChanged, this, &MainWindow::updateStatus);

    m_pageLabel = new QLabel(this);
    m_zoomLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_pageLabel);
    statusBar()->addPermanentWidget(m_zoomLabel);

    setupActions();
    updateActions();
    updateStatus();

    resize(1000, 1200);
}

MainWindow::~MainWindow()
{
    closeSession();
}

void MainWindow::setupActions()
{
    QMenu* fileMenu = menuBar()->addMenu(tr("&File"));
    QMenu* viewMenu = menuBar()->addMenu(tr("&View"));
    QMenu* blocksMenu = menuBar()->addMenu(tr("&Blocks"));
    QToolBar* toolbar = addToolBar(tr("Main"));
    toolbar->setMovable(false);

    auto addAction = [this](QMenu* menu, const QString& text, const QKeySequence& shortcut,
                            void (MainWindow::*slot)(), bool needsDocument) {
        QAction* action = menu->addAction(text);
        action->setShortcut(shortcut);
        connect(action, &QAction::triggered, this, slot);
        if (needsDocument) {
            m_documentActions.append(action);
        }
        return action;
    };

    QAction* openAction = addAction(fileMenu, tr("&Open PDF..."), QKeySequence::Open,
                                    &MainWindow::showOpenPdfDialog, false);
    QAction* saveAction = addAction(fileMenu, tr("&Save Blocks"), QKeySequence::Save,
                                    &MainWindow::saveBlocks, true);
    addAction(fileMenu, tr("&Revert to Saved Blocks"), QKeySequence(), &MainWindow::revertBlocks, true);
    fileMenu->addSeparator();
    m_exportAction = addAction(fileMenu, tr("&Export All..."), QKeySequence(Qt::CTRL | Qt::Key_E),
                               &MainWindow::exportAll, true);
    fileMenu->addSeparator();
    QAction* quitAction = fileMenu->addAction(tr("&Quit"));
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, this, &QWidget::close);

    QAction* prevAction = addAction(viewMenu, tr("&Previous Page"), QKeySequence(Qt::Key_PageUp),
                                    &MainWindow::previousPage, true);
    QAction* nextAction = addAction(viewMenu, tr("&Next Page"), QKeySequence(Qt::Key_PageDown),
                                    &MainWindow::nextPage, true);
    viewMenu->addSeparator();
    QAction* zoomInAction = addAction(viewMenu, tr("Zoom &In"), QKeySequence::ZoomIn,
                                      &MainWindow::zoomIn, true);
    QAction* zoomOutAction = addAction(viewMenu, tr("Zoom &Out"), QKeySequence::ZoomOut,
                                       &MainWindow::zoomOut, true);
    addAction(viewMenu, tr("&Reset Zoom"), QKeySequence(Qt::CTRL | Qt::Key_0),
              &MainWindow::resetZoom, true);

    QAction* groupAction = addAction(blocksMenu, tr("&Group Enabled Blocks"),
                                     QKeySequence(Qt::CTRL | Qt::Key_G),
                                     &MainWindow::groupEnabledBlocks, true);
    addAction(blocksMenu, tr("&Ungroup All"), QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_G),
              &MainWindow::ungroupAll, true);

    toolbar->addAction(openAction);
    toolbar->addAction(saveAction);
    toolbar->addSeparator();
    toolbar->addAction(prevAction);
    toolbar->addAction(nextAction);
    toolbar->addAction(zoomOutAction);
    toolbar->addAction(zoomInAction);
    toolbar->addSeparator();
    toolbar->addAction(groupAction);
    toolbar->addAction(m_exportAction);
}

void MainWindow::updateActions()
{
    const bool hasDocument = m_session != nullptr;
    for (QAction* action : m_documentActions) {
        action->setEnabled(hasDocument);
    }
    if (m_exportAction && m_session) {
        m_exportAction->setEnabled(!m_session->isExporting());
    }
}

// ============================================================================
// Document
// ============================================================================

void MainWindow::showOpenPdfDialog()
{
    QSettings settings("BlockCrop", "App");
    QString lastDir = settings.value("lastOpenDir").toString();

    QString path = QFileDialog::getOpenFileName(this, tr("Open PDF"), lastDir,
                                                tr("PDF Files (*.pdf)"));
    if (path.isEmpty()) {
        return;
    }
    settings.setValue("lastOpenDir", QFileInfo(path).absolutePath());
    openPdf(path);
}

bool MainWindow::openPdf(const QString& path)
{
    QString error;
    std::unique_ptr<SelectionSession> session = SelectionSession::openPdf(path, m_config, &error);
    if (!session) {
        QMessageBox::warning(this, tr("Open PDF"), error);
        return false;
    }

    closeSession();
    m_session = std::move(session);

    // A missing sidecar just means no blocks yet
    if (QFileInfo::exists(m_session->blocksPath())) {
        if (!m_session->loadBlocks(&error)) {
            showNotice(tr("Could not load saved blocks: %1").arg(error));
        }
    }

    connect(m_session.get(), &SelectionSession::currentPageChanged, this, &MainWindow::updateStatus);
    connect(m_session.get(), &SelectionSession::viewChanged, this, &MainWindow::updateStatus);
    connect(m_session.get(), &SelectionSession::dirtyChanged, this, &MainWindow::updateStatus);
    connect(m_session.get(), &SelectionSession::currentRasterFailed, this, &MainWindow::showNotice);
    connect(m_session.get(), &SelectionSession::exportFinished, this, &MainWindow::onExportFinished);
    connect(&m_session->controller(), &SelectionController::noticeRaised, this, &MainWindow::showNotice);

    m_viewport->setSession(m_session.get());
    m_viewport->setFocus();

    setWindowTitle(tr("%1 - BlockCrop").arg(m_session->title()));
    updateActions();
    updateStatus();
    return true;
}

void MainWindow::closeSession()
{
    if (!m_session) {
        return;
    }

    if (m_session->isDirty()) {
        QString error;
        if (!m_session->saveBlocks(&error)) {
            qWarning() << "MainWindow: Failed to save blocks on close:" << error;
        }
    }

    m_viewport->setSession(nullptr);
    m_session->close();
    m_session.reset();
    updateActions();
}

void MainWindow::saveBlocks()
{
    if (!m_session) {
        return;
    }
    QString error;
    if (m_session->saveBlocks(&error)) {
        showNotice(tr("Blocks saved to %1").arg(QFileInfo(m_session->blocksPath()).fileName()));
    } else {
        QMessageBox::warning(this, tr("Save Blocks"), error);
    }
}

void MainWindow::revertBlocks()
{
    if (!m_session) {
        return;
    }
    QString error;
    if (m_session->loadBlocks(&error)) {
        showNotice(tr("Blocks reloaded from disk"));
    } else {
        showNotice(error);
    }
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    closeSession();
    event->accept();
}

// ============================================================================
// Navigation
// ============================================================================

void MainWindow::previousPage()
{
    if (m_session) {
        m_session->setCurrentPage(m_session->currentPage() - 1);
    }
}

void MainWindow::nextPage()
{
    if (m_session) {
        m_session->setCurrentPage(m_session->currentPage() + 1);
    }
}

void MainWindow::zoomIn()
{
    if (m_session) {
        m_session->setZoom(m_session->mapper().zoom() * kZoomStep);
    }
}

void MainWindow::zoomOut()
{
    if (m_session) {
        m_session->setZoom(m_session->mapper().zoom() / kZoomStep);
    }
}

void MainWindow::resetZoom()
{
    if (m_session) {
        m_session->setZoom(1.0);
        m_session->setPanOffset(QPointF(0, 0));
    }
}

// ============================================================================
// Blocks
// ============================================================================

void MainWindow::groupEnabledBlocks()
{
    if (!m_session) {
        return;
    }

    QVector<int> ids;
    for (const Block& block : m_session->store().list()) {
        if (block.enabled && !block.isGrouped()) {
            ids.append(block.id);
        }
    }

    GroupResult result = m_session->store().group(ids);
    if (result.success()) {
        showNotice(tr("Created group %1 with %2 blocks").arg(result.groupId).arg(result.blockIds.size()));
    } else {
        showNotice(result.errorMessage);
    }
}

void MainWindow::ungroupAll()
{
    if (!m_session) {
        return;
    }

    const QVector<int> groups = m_session->store().groupIds();
    for (int groupId : groups) {
        GroupResult result = m_session->store().ungroup(groupId);
        if (!result.success()) {
            showNotice(result.errorMessage);
        }
    }
    if (!groups.isEmpty()) {
        showNotice(tr("Removed %1 groups").arg(groups.size()));
    }
}

// ============================================================================
// Export
// ============================================================================

void MainWindow::exportAll()
{
    if (!m_session || m_session->isExporting()) {
        return;
    }

    QSettings settings("BlockCrop", "App");
    QString lastDir = settings.value("lastExportDir", QFileInfo(m_session->pdfPath()).absolutePath()).toString();

    QString dir = QFileDialog::getExistingDirectory(this, tr("Export Blocks To"), lastDir);
    if (dir.isEmpty()) {
        return;
    }
    settings.setValue("lastExportDir", dir);

    m_exportDir = dir;
    if (m_session->exportAllAsync()) {
        showNotice(tr("Exporting..."));
        updateActions();
    }
}

void MainWindow::onExportFinished(const QVector<ExportResult>& results)
{
    updateActions();

    if (results.isEmpty()) {
        showNotice(tr("Nothing to export: no enabled blocks"));
        return;
    }

    ExportWriteSummary summary = ExportWriter::writeAll(results, m_exportDir);
    if (summary.allSucceeded()) {
        showNotice(tr("Exported %1 images to %2").arg(summary.written).arg(m_exportDir));
        return;
    }

    QMessageBox::warning(this, tr("Export"),
        tr("Exported %1 of %2 units.\n\n%3")
            .arg(summary.written)
            .arg(results.size())
            .arg(summary.errors.join(QLatin1Char('\n'))));
}

// ============================================================================
// Status
// ============================================================================

void MainWindow::showNotice(const QString& message)
{
    statusBar()->showMessage(message, kNoticeTimeoutMs);
}

void MainWindow::updateStatus()
{
    if (!m_session) {
        m_pageLabel->setText(tr("No document"));
        m_zoomLabel->clear();
        return;
    }

    QString pageText = tr("Page %1 / %2").arg(m_session->currentPage() + 1).arg(m_session->pageCount());
    if (m_session->isDirty()) {
        pageText += QStringLiteral(" *");
    }
    m_pageLabel->setText(pageText);
    m_zoomLabel->setText(QStringLiteral("%1%").arg(qRound(m_session->mapper().zoom() * 100)));
}
