#include "SelectionSession.h"
#include "PageRasterCache.h"
#include "BlockStore.h"
#include "SelectionController.h"
#include "../pdf/PdfProvider.h"
#include "../pdf/PdfPageRasterizer.h"

#include <QFileInfo>
#include <QtConcurrent>
#include <QDebug>

std::unique_ptr<SelectionSession> SelectionSession::openPdf(const QString& pdfPath,
                                                            const SessionConfig& config,
                                                            QString* errorMessage)
{
    std::unique_ptr<PdfProvider> provider = PdfProvider::create(pdfPath);
    if (!provider) {
        if (errorMessage) {
            *errorMessage = tr("Cannot open PDF: %1").arg(pdfPath);
        }
        return nullptr;
    }
    if (provider->pageCount() <= 0) {
        if (errorMessage) {
            *errorMessage = tr("PDF has no pages: %1").arg(pdfPath);
        }
        return nullptr;
    }

    QVector<QSizeF> pageSizes;
    pageSizes.reserve(provider->pageCount());
    for (int i = 0; i < provider->pageCount(); ++i) {
        pageSizes.append(provider->pageSize(i));
    }

    auto session = std::make_unique<SelectionSession>(
        std::make_shared<PdfPageRasterizer>(pdfPath), pageSizes, config);
    session->m_pdfPath = pdfPath;
    session->m_title = provider->title().isEmpty()
        ? QFileInfo(pdfPath).completeBaseName()
        : provider->title();

    qDebug() << "SelectionSession: Opened" << pdfPath << "with" << pageSizes.size() << "pages";
    return session;
}

SelectionSession::SelectionSession(std::shared_ptr<const PageRasterizer> rasterizer,
                                   const QVector<QSizeF>& pageSizes,
                                   const SessionConfig& config, QObject* parent)
    : QObject(parent)
    , m_pageSizes(pageSizes)
    , m_config(config)
    , m_mapper(config)
{
    m_cache = std::make_unique<PageRasterCache>(std::move(rasterizer), config.cacheCapacity);
    m_store = std::make_unique<BlockStore>();
    m_store->setPageBounds(pageSizes);
    m_controller = std::make_unique<SelectionController>(*m_store, m_mapper, m_config);
    m_composer = std::make_unique<ExportComposer>(*m_cache, m_config);

    connect(m_cache.get(), &PageRasterCache::rasterReady, this, &SelectionSession::onRasterReady);
    connect(m_cache.get(), &PageRasterCache::rasterFailed, this, &SelectionSession::onRasterFailed);

    connect(m_store.get(), &BlockStore::blockCreated, this, [this]() { setDirty(true); });
    connect(m_store.get(), &BlockStore::blockToggled, this, [this]() { setDirty(true); });
    connect(m_store.get(), &BlockStore::blockRemoved, this, [this]() { setDirty(true); });
    connect(m_store.get(), &BlockStore::groupCreated, this, [this]() { setDirty(true); });
    connect(m_store.get(), &BlockStore::groupRemoved, this, [this]() { setDirty(true); });

    connect(&m_exportWatcher, &QFutureWatcher<QVector<ExportResult>>::finished, this, [this]() {
        emit exportFinished(m_exportWatcher.result());
    });
}

SelectionSession::~SelectionSession()
{
    close();
}

QSizeF SelectionSession::pageSize(int pageIndex) const
{
    if (pageIndex < 0 || pageIndex >= m_pageSizes.size()) {
        return QSizeF();
    }
    return m_pageSizes[pageIndex];
}

// ============================================================================
// View State
// ============================================================================

bool SelectionSession::setCurrentPage(int pageIndex)
{
    if (m_closed || pageIndex < 0 || pageIndex >= m_pageSizes.size()) {
        return false;
    }
    if (pageIndex == m_currentPage) {
        return true;
    }

    m_currentPage = pageIndex;
    m_rasterError.clear();
    m_controller->setCurrentPage(pageIndex);
    m_mapper.setPanOffset(QPointF(0, 0));

    emit currentPageChanged(pageIndex);
    requestCurrentRaster();
    return true;
}

bool SelectionSession::setZoom(qreal zoom)
{
    if (!m_mapper.setZoom(zoom)) {
        return false;
    }
    emit viewChanged();
    requestCurrentRaster();
    return true;
}

void SelectionSession::setPanOffset(QPointF offset)
{
    m_mapper.setPanOffset(offset);
    emit viewChanged();
}

bool SelectionSession::requestCurrentRaster()
{
    if (m_closed || m_pageSizes.isEmpty()) {
        return false;
    }

    const qreal dpi = m_mapper.targetRenderDpi();
    if (m_cache->request(m_currentPage, dpi)) {
        m_mapper.setActiveResolution(dpi);
        m_rasterError.clear();
        return true;
    }
    return false;
}

RasterBuffer SelectionSession::currentRaster() const
{
    RasterBuffer buffer = m_cache->cached(m_currentPage, m_mapper.targetRenderDpi());
    if (buffer.isValid()) {
        return buffer;
    }

    qreal staleDpi = m_cache->cachedDpi(m_currentPage);
    if (staleDpi > 0) {
        return m_cache->cached(m_currentPage, staleDpi);
    }
    return RasterBuffer();
}

void SelectionSession::onRasterReady(int pageIndex, qreal dpi)
{
    if (pageIndex != m_currentPage) {
        return;
    }
    m_mapper.setActiveResolution(dpi);
    m_rasterError.clear();
    emit currentRasterChanged();
}

void SelectionSession::onRasterFailed(int pageIndex, qreal dpi, const QString& message)
{
    Q_UNUSED(dpi);
    if (pageIndex != m_currentPage) {
        return;
    }
    m_rasterError = message;
    emit currentRasterFailed(message);
}

// ============================================================================
// Export
// ============================================================================

ExportResult SelectionSession::exportSingle(int blockId, qreal dpi) const
{
    return m_composer->exportSingle(m_store->snapshot(), blockId, dpi);
}

ExportResult SelectionSession::exportGroup(int groupId, qreal dpi) const
{
    return m_composer->exportGroup(m_store->snapshot(), groupId, dpi);
}

QVector<ExportResult> SelectionSession::exportAll(bool enabledOnly, qreal dpi) const
{
    return m_composer->exportAll(m_store->snapshot(), enabledOnly, dpi);
}

bool SelectionSession::exportAllAsync(bool enabledOnly, qreal dpi)
{
    if (m_closed || isExporting()) {
        return false;
    }

    const BlockSnapshot snapshot = m_store->snapshot();
    const ExportComposer* composer = m_composer.get();

    m_exportWatcher.setFuture(QtConcurrent::run([composer, snapshot, enabledOnly, dpi]() {
        return composer->exportAll(snapshot, enabledOnly, dpi);
    }));
    return true;
}

bool SelectionSession::isExporting() const
{
    return m_exportWatcher.isRunning();
}

// ============================================================================
// Persistence
// ============================================================================

QString SelectionSession::blocksPath() const
{
    if (m_pdfPath.isEmpty()) {
        return QString();
    }
    return m_pdfPath + QStringLiteral(".blocks.json");
}

bool SelectionSession::saveBlocks(QString* errorMessage)
{
    const QString path = blocksPath();
    if (path.isEmpty()) {
        if (errorMessage) {
            *errorMessage = tr("Session has no document file");
        }
        return false;
    }

    if (!m_store->save(path, errorMessage)) {
        return false;
    }
    setDirty(false);
    return true;
}

bool SelectionSession::loadBlocks(QString* errorMessage)
{
    const QString path = blocksPath();
    if (path.isEmpty() || !QFileInfo::exists(path)) {
        if (errorMessage) {
            *errorMessage = tr("No saved blocks for this document");
        }
        return false;
    }

    if (!m_store->load(path, errorMessage)) {
        return false;
    }
    setDirty(false);
    return true;
}

void SelectionSession::setDirty(bool dirty)
{
    if (m_dirty == dirty) {
        return;
    }
    m_dirty = dirty;
    emit dirtyChanged(dirty);
}

void SelectionSession::close()
{
    if (m_closed) {
        return;
    }
    m_closed = true;

    // The export worker reads the composer and cache; let it finish first.
    if (m_exportWatcher.isRunning()) {
        m_exportWatcher.waitForFinished();
    }

    m_controller->cancel();
    m_store->clear();
    m_cache->clear();
    m_rasterError.clear();
    m_dirty = false;

    qDebug() << "SelectionSession: Closed" << (m_pdfPath.isEmpty() ? QStringLiteral("<memory>") : m_pdfPath);
}
