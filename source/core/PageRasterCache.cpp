#include "PageRasterCache.h"
#include "../pdf/PageRasterizer.h"

#include <QFutureWatcher>
#include <QMutexLocker>
#include <QtConcurrent>
#include <QDebug>
#include <QtMath>

PageRasterCache::PageRasterCache(std::shared_ptr<const PageRasterizer> rasterizer,
                                 int capacity, QObject* parent)
    : QObject(parent)
    , m_rasterizer(std::move(rasterizer))
    , m_capacity(qMax(1, capacity))
{
    m_pool.setMaxThreadCount(2);
}

PageRasterCache::~PageRasterCache()
{
    QVector<QFuture<RasterResult>> pending;
    {
        QMutexLocker locker(&m_mutex);
        for (auto it = m_inFlight.cbegin(); it != m_inFlight.cend(); ++it) {
            pending.append(it.value().future);
        }
        m_inFlight.clear();
        m_entries.clear();
        m_wantedDpi.clear();
    }

    // Tasks only hold the rasterizer, never the cache; waiting cannot deadlock.
    for (QFuture<RasterResult>& future : pending) {
        future.waitForFinished();
    }
    m_pool.waitForDone();
}

PageRasterCache::Key PageRasterCache::keyFor(int pageIndex, qreal dpi)
{
    // Milli-DPI keeps fractional resolutions distinct without float hashing.
    return Key(pageIndex, qRound64(dpi * 1000.0));
}

// ============================================================================
// Lookup
// ============================================================================

RasterResult PageRasterCache::ensure(int pageIndex, qreal dpi)
{
    RasterResult result;
    if (pageIndex < 0 || dpi <= 0) {
        result.error = BlockError::RasterizationError;
        result.errorMessage = tr("Cannot rasterize page %1 at %2 dpi").arg(pageIndex).arg(dpi);
        return result;
    }

    QFuture<RasterResult> future;
    quint64 token = 0;
    {
        QMutexLocker locker(&m_mutex);
        for (const RasterBuffer& entry : m_entries) {
            if (entry.matches(pageIndex, dpi)) {
                result.buffer = entry;
                return result;
            }
        }
        m_wantedDpi[pageIndex] = dpi;
        InFlight& inFlight = startOrJoinLocked(pageIndex, dpi);
        future = inFlight.future;
        token = inFlight.token;
    }

    future.waitForFinished();
    result = future.result();
    if (complete(pageIndex, dpi, token, result)) {
        // The page's buffer changed under the owner; whoever inserts reports it.
        emit rasterReady(pageIndex, dpi);
    }
    return result;
}

bool PageRasterCache::request(int pageIndex, qreal dpi)
{
    if (pageIndex < 0 || dpi <= 0) {
        qWarning() << "PageRasterCache: Ignoring request for page" << pageIndex << "at" << dpi << "dpi";
        return false;
    }

    QFuture<RasterResult> future;
    quint64 token = 0;
    {
        QMutexLocker locker(&m_mutex);
        m_wantedDpi[pageIndex] = dpi;
        for (const RasterBuffer& entry : m_entries) {
            if (entry.matches(pageIndex, dpi)) {
                return true;
            }
        }

        InFlight& inFlight = startOrJoinLocked(pageIndex, dpi);
        if (inFlight.watched) {
            return false;
        }
        inFlight.watched = true;
        future = inFlight.future;
        token = inFlight.token;
    }

    watch(pageIndex, dpi, token, future);
    return false;
}

RasterBuffer PageRasterCache::cached(int pageIndex, qreal dpi) const
{
    QMutexLocker locker(&m_mutex);
    for (const RasterBuffer& entry : m_entries) {
        if (entry.matches(pageIndex, dpi)) {
            return entry;
        }
    }
    return RasterBuffer();
}

bool PageRasterCache::contains(int pageIndex, qreal dpi) const
{
    return cached(pageIndex, dpi).isValid();
}

qreal PageRasterCache::cachedDpi(int pageIndex) const
{
    QMutexLocker locker(&m_mutex);
    for (const RasterBuffer& entry : m_entries) {
        if (entry.pageIndex == pageIndex) {
            return entry.dpi;
        }
    }
    return 0;
}

bool PageRasterCache::isInFlight(int pageIndex, qreal dpi) const
{
    QMutexLocker locker(&m_mutex);
    return m_inFlight.contains(keyFor(pageIndex, dpi));
}

int PageRasterCache::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_entries.size();
}

int PageRasterCache::capacity() const
{
    QMutexLocker locker(&m_mutex);
    return m_capacity;
}

// ============================================================================
// Invalidation
// ============================================================================

void PageRasterCache::invalidate(int pageIndex)
{
    QMutexLocker locker(&m_mutex);

    for (int i = m_entries.size() - 1; i >= 0; --i) {
        if (m_entries[i].pageIndex == pageIndex) {
            m_entries.removeAt(i);
        }
    }

    // Forgetting the in-flight entry makes its result stale on arrival.
    for (auto it = m_inFlight.begin(); it != m_inFlight.end();) {
        if (it.key().first == pageIndex) {
            it = m_inFlight.erase(it);
        } else {
            ++it;
        }
    }
    m_wantedDpi.remove(pageIndex);
}

void PageRasterCache::clear()
{
    QMutexLocker locker(&m_mutex);
    m_entries.clear();
    m_inFlight.clear();
    m_wantedDpi.clear();
}

// ============================================================================
// Internals
// ============================================================================

RasterResult PageRasterCache::rasterizePage(std::shared_ptr<const PageRasterizer> rasterizer,
                                            int pageIndex, qreal dpi)
{
    RasterResult result;
    QString cause;
    QImage image = rasterizer ? rasterizer->rasterize(pageIndex, dpi, &cause) : QImage();

    if (image.isNull()) {
        if (cause.isEmpty()) {
            cause = QStringLiteral("rasterizer returned no image");
        }
        result.error = BlockError::RasterizationError;
        result.errorMessage = QStringLiteral("Failed to rasterize page %1: %2").arg(pageIndex).arg(cause);
        qWarning() << "PageRasterCache:" << result.errorMessage;
        return result;
    }

    result.buffer.pageIndex = pageIndex;
    result.buffer.dpi = dpi;
    result.buffer.image = image;
    return result;
}

PageRasterCache::InFlight& PageRasterCache::startOrJoinLocked(int pageIndex, qreal dpi)
{
    const Key key = keyFor(pageIndex, dpi);
    auto it = m_inFlight.find(key);
    if (it != m_inFlight.end()) {
        return it.value();
    }

    InFlight inFlight;
    inFlight.token = m_nextToken++;
    inFlight.future = QtConcurrent::run(&m_pool, &PageRasterCache::rasterizePage,
                                        m_rasterizer, pageIndex, dpi);
    return m_inFlight.insert(key, inFlight).value();
}

bool PageRasterCache::complete(int pageIndex, qreal dpi, quint64 token, const RasterResult& result)
{
    QMutexLocker locker(&m_mutex);

    const Key key = keyFor(pageIndex, dpi);
    auto it = m_inFlight.find(key);
    if (it == m_inFlight.end() || it.value().token != token) {
        // Already completed by another waiter, or cleared/invalidated meanwhile.
        return false;
    }
    m_inFlight.erase(it);

    if (!result.success()) {
        return false;
    }

    // The page was re-requested at another resolution after this started.
    auto wanted = m_wantedDpi.constFind(pageIndex);
    if (wanted == m_wantedDpi.constEnd() || !result.buffer.matches(pageIndex, wanted.value())) {
        qDebug() << "PageRasterCache: Discarding stale raster for page" << pageIndex << "at" << dpi << "dpi";
        return false;
    }

    insertLocked(result.buffer);
    return true;
}

void PageRasterCache::insertLocked(const RasterBuffer& buffer)
{
    // One resolution per page.
    for (int i = m_entries.size() - 1; i >= 0; --i) {
        if (m_entries[i].pageIndex == buffer.pageIndex) {
            m_entries.removeAt(i);
        }
    }

    // Evict the page furthest from the new one.
    while (m_entries.size() >= m_capacity) {
        int furthestIdx = 0;
        int maxDistance = -1;
        for (int i = 0; i < m_entries.size(); ++i) {
            int distance = qAbs(m_entries[i].pageIndex - buffer.pageIndex);
            if (distance > maxDistance) {
                maxDistance = distance;
                furthestIdx = i;
            }
        }
        m_entries.removeAt(furthestIdx);
    }

    m_entries.append(buffer);
}

void PageRasterCache::watch(int pageIndex, qreal dpi, quint64 token, const QFuture<RasterResult>& future)
{
    auto* watcher = new QFutureWatcher<RasterResult>(this);

    connect(watcher, &QFutureWatcher<RasterResult>::finished, this,
            [this, watcher, pageIndex, dpi, token]() {
        const RasterResult result = watcher->result();
        watcher->deleteLater();

        // A joined ensure() that stored the buffer first has already reported it.
        if (complete(pageIndex, dpi, token, result)) {
            emit rasterReady(pageIndex, dpi);
        } else if (!result.success()) {
            emit rasterFailed(pageIndex, dpi, result.errorMessage);
        }
    });

    watcher->setFuture(future);
}
