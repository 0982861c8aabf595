#pragma once

// ============================================================================
// TestRasterizer - Deterministic PageRasterizer for unit tests
// ============================================================================
// Produces a solid image of size page * dpi / 72 filled with a per-page
// colour, so crops can be identified by their pixels. Rendering can be held
// at a gate to create in-flight work on demand, and pages can be made to fail.
// ============================================================================

#include "../pdf/PageRasterizer.h"

#include <QAtomicInt>
#include <QColor>
#include <QMutex>
#include <QMutexLocker>
#include <QSet>
#include <QSizeF>
#include <QVector>
#include <QWaitCondition>
#include <QtMath>

class TestRasterizer : public PageRasterizer {
public:
    explicit TestRasterizer(const QVector<QSizeF>& pageSizes)
        : m_pageSizes(pageSizes)
    {
    }

    static QColor pageColor(int pageIndex)
    {
        return QColor((pageIndex * 40) % 256, 100, 200);
    }

    QImage rasterize(int pageIndex, qreal dpi, QString* errorMessage = nullptr) const override
    {
        m_started.fetchAndAddOrdered(1);

        {
            QMutexLocker locker(&m_gateMutex);
            while (!m_gateOpen) {
                m_gateCond.wait(&m_gateMutex);
            }
        }

        QImage image;
        if (pageIndex < 0 || pageIndex >= m_pageSizes.size()) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("no such page");
            }
        } else if (isFailing(pageIndex)) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("simulated failure");
            }
        } else {
            const qreal scale = dpi / 72.0;
            const QSizeF size = m_pageSizes[pageIndex];
            image = QImage(qRound(size.width() * scale), qRound(size.height() * scale),
                           QImage::Format_ARGB32);
            image.fill(pageColor(pageIndex));
        }

        m_finished.fetchAndAddOrdered(1);
        return image;
    }

    int startedCount() const { return m_started.loadAcquire(); }
    int finishedCount() const { return m_finished.loadAcquire(); }

    void setFailing(int pageIndex)
    {
        QMutexLocker locker(&m_gateMutex);
        m_failingPages.insert(pageIndex);
    }

    /**
     * @brief Block every rasterization until openGate().
     */
    void closeGate()
    {
        QMutexLocker locker(&m_gateMutex);
        m_gateOpen = false;
    }

    void openGate()
    {
        QMutexLocker locker(&m_gateMutex);
        m_gateOpen = true;
        m_gateCond.wakeAll();
    }

private:
    bool isFailing(int pageIndex) const
    {
        QMutexLocker locker(&m_gateMutex);
        return m_failingPages.contains(pageIndex);
    }

    QVector<QSizeF> m_pageSizes;
    QSet<int> m_failingPages;

    mutable QAtomicInt m_started;
    mutable QAtomicInt m_finished;

    mutable QMutex m_gateMutex;
    mutable QWaitCondition m_gateCond;
    bool m_gateOpen = true;
};
