#pragma once

// ============================================================================
// PageRasterCache - Owns rasterized page buffers
// ============================================================================
// One buffer per page, at one resolution. Asking for a page at a different
// DPI replaces the old buffer once the new one is ready.
//
// Cache misses are rendered on a private QThreadPool:
// - request() is for the owner (GUI) thread. It never blocks; the result is
//   delivered back on the owner thread via rasterReady/rasterFailed.
// - ensure() blocks until the buffer exists. Meant for export workers.
//
// rasterReady is emitted exactly once for every buffer that enters the cache,
// by whichever path stored it. A buffer stored by ensure() is reported from
// the calling thread (queued to owner-thread receivers).
//
// Identical (page, dpi) misses share one in-flight QFuture (coalescing).
// Results are dropped on arrival if the cache was cleared, the page was
// invalidated, or the page was re-requested at another DPI meanwhile.
//
// Thread Safety: all state is guarded by m_mutex. The rasterizer itself is
// only ever called from pool threads and never touches cache state.
// ============================================================================

#include "RasterBuffer.h"

#include <QObject>
#include <QFuture>
#include <QHash>
#include <QMutex>
#include <QPair>
#include <QThreadPool>
#include <QVector>
#include <memory>

class PageRasterizer;

class PageRasterCache : public QObject {
    Q_OBJECT

public:
    /**
     * @param rasterizer Thread-safe page rasterizer (shared with worker tasks).
     * @param capacity Maximum number of cached pages.
     */
    explicit PageRasterCache(std::shared_ptr<const PageRasterizer> rasterizer,
                             int capacity = 6, QObject* parent = nullptr);

    /**
     * @brief Discards everything and waits for running rasterizations.
     */
    ~PageRasterCache() override;

    // ===== Lookup =====

    /**
     * @brief Get a buffer, rasterizing synchronously on a miss.
     *
     * Callable from any thread. Joins an in-flight rasterization for the same
     * key instead of starting a second one. The returned buffer always has
     * the requested DPI; on failure the cache is left unchanged.
     */
    RasterResult ensure(int pageIndex, qreal dpi);

    /**
     * @brief Ask for a buffer without blocking (owner thread only).
     * @return True if it is already cached; otherwise rasterReady or
     *         rasterFailed follows.
     */
    bool request(int pageIndex, qreal dpi);

    /**
     * @brief Cached buffer for the exact key, or an invalid buffer.
     */
    RasterBuffer cached(int pageIndex, qreal dpi) const;

    bool contains(int pageIndex, qreal dpi) const;

    /**
     * @brief DPI of the buffer cached for a page, or 0 if none.
     */
    qreal cachedDpi(int pageIndex) const;

    bool isInFlight(int pageIndex, qreal dpi) const;

    int size() const;
    int capacity() const;

    // ===== Invalidation =====

    /**
     * @brief Drop the buffer for one page (e.g. the page was rotated).
     *
     * In-flight work for the page is discarded when it arrives.
     */
    void invalidate(int pageIndex);

    /**
     * @brief Drop everything. In-flight work is discarded when it arrives.
     */
    void clear();

signals:
    void rasterReady(int pageIndex, qreal dpi);
    void rasterFailed(int pageIndex, qreal dpi, const QString& message);

private:
    using Key = QPair<int, qint64>;

    struct InFlight {
        quint64 token = 0;              ///< Identifies this rasterization
        QFuture<RasterResult> future;
        bool watched = false;           ///< A QFutureWatcher reports it to the owner thread
    };

    static Key keyFor(int pageIndex, qreal dpi);

    /**
     * @brief Run the rasterizer and wrap the outcome (worker thread).
     */
    static RasterResult rasterizePage(std::shared_ptr<const PageRasterizer> rasterizer,
                                      int pageIndex, qreal dpi);

    /**
     * @brief Start a rasterization, or join the one already running.
     *
     * Must be called with m_mutex held.
     */
    InFlight& startOrJoinLocked(int pageIndex, qreal dpi);

    /**
     * @brief Store a finished result unless it went stale.
     * @return True if the buffer is now cached.
     */
    bool complete(int pageIndex, qreal dpi, quint64 token, const RasterResult& result);

    /**
     * @brief Insert a buffer, replacing the page's old one and evicting
     *        the furthest page when full. Must be called with m_mutex held.
     */
    void insertLocked(const RasterBuffer& buffer);

    void watch(int pageIndex, qreal dpi, quint64 token, const QFuture<RasterResult>& future);

    std::shared_ptr<const PageRasterizer> m_rasterizer;
    QThreadPool m_pool;

    QVector<RasterBuffer> m_entries;    ///< At most one per page
    QHash<Key, InFlight> m_inFlight;
    QHash<int, qreal> m_wantedDpi;      ///< Latest DPI requested per page
    quint64 m_nextToken = 1;
    int m_capacity;

    mutable QMutex m_mutex;
};
