#pragma once

// ============================================================================
// SelectionSession - Everything scoped to one open document
// ============================================================================
// Owns, per document:
// - CoordinateMapper (zoom / pan / reference DPI)
// - PageRasterCache  (rasterized pages)
// - BlockStore       (blocks and groups)
// - SelectionController (pointer state machine)
// - ExportComposer   (crop + merge)
//
// Created on document open, torn down by close() or the destructor. There is
// no global registry: widgets get a pointer to the session they display.
// ============================================================================

#include "SessionConfig.h"
#include "CoordinateMapper.h"
#include "RasterBuffer.h"
#include "../export/ExportComposer.h"

#include <QObject>
#include <QFutureWatcher>
#include <QSizeF>
#include <QVector>
#include <memory>

class PageRasterizer;
class PageRasterCache;
class BlockStore;
class SelectionController;

class SelectionSession : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Open a PDF and build a session for it.
     * @return nullptr if the file cannot be opened (reason in errorMessage).
     */
    static std::unique_ptr<SelectionSession> openPdf(const QString& pdfPath,
                                                     const SessionConfig& config = SessionConfig(),
                                                     QString* errorMessage = nullptr);

    /**
     * @brief Build a session around any rasterizer (tests, headless tools).
     * @param pageSizes Document-space size of every page, in points.
     */
    SelectionSession(std::shared_ptr<const PageRasterizer> rasterizer,
                     const QVector<QSizeF>& pageSizes,
                     const SessionConfig& config = SessionConfig(),
                     QObject* parent = nullptr);

    ~SelectionSession() override;

    // ===== Document =====

    QString pdfPath() const { return m_pdfPath; }
    QString title() const { return m_title; }
    int pageCount() const { return m_pageSizes.size(); }
    QSizeF pageSize(int pageIndex) const;
    const SessionConfig& config() const { return m_config; }
    bool isClosed() const { return m_closed; }

    // ===== Components =====

    CoordinateMapper& mapper() { return m_mapper; }
    const CoordinateMapper& mapper() const { return m_mapper; }
    PageRasterCache& cache() { return *m_cache; }
    BlockStore& store() { return *m_store; }
    const BlockStore& store() const { return *m_store; }
    SelectionController& controller() { return *m_controller; }
    ExportComposer& composer() { return *m_composer; }

    // ===== View State =====

    int currentPage() const { return m_currentPage; }

    /**
     * @brief Switch the displayed page and request its raster.
     * @return False if the index is out of range.
     */
    bool setCurrentPage(int pageIndex);

    /**
     * @brief Change zoom (clamped) and request a raster at the new DPI.
     */
    bool setZoom(qreal zoom);
    void setPanOffset(QPointF offset);

    /**
     * @brief Ask the cache for the current page at the view's target DPI.
     * @return True if the raster is already available.
     */
    bool requestCurrentRaster();

    /**
     * @brief Best raster for the current page.
     *
     * Prefers the target DPI; falls back to whatever resolution is still
     * cached for the page while the new one is rendering.
     */
    RasterBuffer currentRaster() const;

    /**
     * @brief Last rasterization error for the current page (empty if none).
     */
    QString currentRasterError() const { return m_rasterError; }

    // ===== Export =====

    ExportResult exportSingle(int blockId, qreal dpi = 0) const;
    ExportResult exportGroup(int groupId, qreal dpi = 0) const;
    QVector<ExportResult> exportAll(bool enabledOnly = true, qreal dpi = 0) const;

    /**
     * @brief Run exportAll on a worker thread.
     *
     * The block snapshot is taken before returning. exportFinished is
     * emitted on this object's thread.
     * @return False if an export is already running.
     */
    bool exportAllAsync(bool enabledOnly = true, qreal dpi = 0);
    bool isExporting() const;

    // ===== Persistence =====

    /**
     * @brief Sidecar block file: "<pdf>.blocks.json" (empty without a PDF).
     */
    QString blocksPath() const;

    bool saveBlocks(QString* errorMessage = nullptr);

    /**
     * @brief Replace the blocks with the sidecar contents (revert to saved).
     */
    bool loadBlocks(QString* errorMessage = nullptr);

    /**
     * @brief True if blocks changed since the last save/load.
     */
    bool isDirty() const { return m_dirty; }

    /**
     * @brief Release blocks and rasters. Safe to call more than once.
     */
    void close();

signals:
    void currentPageChanged(int pageIndex);
    void viewChanged();
    void currentRasterChanged();
    void currentRasterFailed(const QString& message);
    void exportFinished(const QVector<ExportResult>& results);
    void dirtyChanged(bool dirty);

private slots:
    void onRasterReady(int pageIndex, qreal dpi);
    void onRasterFailed(int pageIndex, qreal dpi, const QString& message);

private:
    void setDirty(bool dirty);

    QString m_pdfPath;
    QString m_title;
    QVector<QSizeF> m_pageSizes;
    const SessionConfig m_config;

    CoordinateMapper m_mapper;
    std::unique_ptr<PageRasterCache> m_cache;
    std::unique_ptr<BlockStore> m_store;
    std::unique_ptr<SelectionController> m_controller;
    std::unique_ptr<ExportComposer> m_composer;

    QFutureWatcher<QVector<ExportResult>> m_exportWatcher;

    int m_currentPage = 0;
    QString m_rasterError;
    bool m_dirty = false;
    bool m_closed = false;
};
