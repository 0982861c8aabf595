#ifndef MAINWINDOW_H
#define MAINWINDOW_H

// ============================================================================
// MainWindow - Application shell around one SelectionSession
// ============================================================================
// Owns the open session and the BlockViewport showing it. Block data is
// loaded from the sidecar file on open and saved back automatically when the
// document is closed or replaced.
// ============================================================================

#include <QMainWindow>
#include <QLabel>
#include <QPointer>
#include <QCloseEvent>
#include <memory>

#include "core/SessionConfig.h"
#include "export/ExportComposer.h"

class BlockViewport;
class SelectionSession;
class QAction;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    /**
     * @brief Open a PDF, replacing the current document.
     * @return False (with a warning shown) if the file cannot be opened.
     */
    bool openPdf(const QString& path);

public slots:
    void showOpenPdfDialog();
    void saveBlocks();
    void revertBlocks();

    void previousPage();
    void nextPage();

    void zoomIn();
    void zoomOut();
    void resetZoom();

    /**
     * @brief Group every enabled, ungrouped block of the document.
     */
    void groupEnabledBlocks();

    /**
     * @brief Dissolve all groups.
     */
    void ungroupAll();

    /**
     * @brief Export all enabled units to a chosen directory (async).
     */
    void exportAll();

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onExportFinished(const QVector<ExportResult>& results);
    void showNotice(const QString& message);
    void updateStatus();

private:
    void setupActions();
    void closeSession();
    void updateActions();

    SessionConfig m_config;
    std::unique_ptr<SelectionSession> m_session;
    BlockViewport* m_viewport = nullptr;

    QLabel* m_pageLabel = nullptr;
    QLabel* m_zoomLabel = nullptr;

    QString m_exportDir;    ///< Destination of the running/last export

    // Actions enabled only with an open document
    QList<QAction*> m_documentActions;
    QAction* m_exportAction = nullptr;
};

#endif // MAINWINDOW_H
