#pragma once

// ============================================================================
// BlockStore - Authoritative model of blocks and groups for one document
// ============================================================================
// Owns every Block of a session plus the derived groupId -> ids index.
// Blocks are kept in creation order, which is also their z-order: later
// blocks draw on top and win hit tests.
//
// Every successful mutation emits exactly one signal, synchronously and in
// order. A failed operation leaves the store untouched and emits nothing.
//
// Not thread-safe: mutate on the owner thread only. Export workers read
// snapshot() copies instead.
// ============================================================================

#include "Block.h"

#include <QObject>
#include <QHash>
#include <QJsonObject>
#include <QPointF>
#include <QSet>
#include <QSizeF>
#include <QVector>

class BlockStore : public QObject {
    Q_OBJECT

public:
    explicit BlockStore(QObject* parent = nullptr);

    // ===== Pages =====

    /**
     * @brief Set the document-space size of every page (in points).
     *
     * Blocks are clamped against these bounds at creation time.
     */
    void setPageBounds(const QVector<QSizeF>& pageSizes);
    int pageCount() const { return m_pageSizes.size(); }
    QRectF pageRect(int pageIndex) const;

    // ===== Mutation =====

    /**
     * @brief Create a block from a rectangle in document space.
     *
     * The rect is normalized and clamped to the page. Fails with
     * InvalidRegion for an unknown page or if nothing of positive area
     * remains after clamping.
     */
    BlockResult create(int pageIndex, const QRectF& rect);

    BlockResult toggle(int blockId);

    /**
     * @brief Delete a block, dropping it from its group.
     *
     * A group left with no members disappears (groupRemoved is not emitted
     * for it; listeners see the blockRemoved).
     */
    BlockResult remove(int blockId);

    /**
     * @brief Put two or more ungrouped blocks into a fresh group.
     */
    GroupResult group(const QVector<int>& blockIds);

    GroupResult ungroup(int groupId);

    /**
     * @brief Destroy every block on a page.
     * @return Number of blocks removed.
     */
    int removePage(int pageIndex);

    /**
     * @brief Drop all blocks and groups. Id counters keep running.
     */
    void clear();

    // ===== Queries =====

    /**
     * @brief Blocks in creation order, optionally restricted to one page.
     */
    QVector<Block> list(int pageIndex = -1) const;

    Block block(int blockId) const;
    bool contains(int blockId) const { return indexOf(blockId) >= 0; }
    int count() const { return m_blocks.size(); }
    bool isEmpty() const { return m_blocks.isEmpty(); }

    QVector<Block> groupMembers(int groupId) const;
    bool hasGroup(int groupId) const { return m_groups.contains(groupId); }
    QVector<int> groupIds() const;

    /**
     * @brief Topmost block on a page containing a document-space point.
     * @return Invalid Block if none.
     */
    Block blockAt(int pageIndex, QPointF docPt) const;

    /**
     * @brief Immutable copy of all blocks for export workers.
     */
    BlockSnapshot snapshot() const { return m_blocks; }

    int nextBlockId() const { return m_nextBlockId; }
    int nextGroupId() const { return m_nextGroupId; }

    // ===== Persistence =====

    QJsonObject toJson() const;

    /**
     * @brief Replace the contents with persisted block data.
     *
     * Malformed entries and rects that clamp to nothing are skipped with a
     * warning. Emits blocksReset once.
     * @return False if the object is not block data at all.
     */
    bool loadJson(const QJsonObject& obj, QString* errorMessage = nullptr);

    /**
     * @brief Write the block data atomically.
     */
    bool save(const QString& path, QString* errorMessage = nullptr) const;

    /**
     * @brief Read block data written by save(). A missing file is an error.
     */
    bool load(const QString& path, QString* errorMessage = nullptr);

signals:
    void blockCreated(const Block& block);
    void blockToggled(int blockId, bool enabled);
    void blockRemoved(int blockId);
    void groupCreated(int groupId, const QVector<int>& blockIds);
    void groupRemoved(int groupId);
    void blocksReset();

private:
    int indexOf(int blockId) const;
    QRectF clampToPage(int pageIndex, const QRectF& rect) const;
    void detachFromGroup(const Block& block);

    QVector<QSizeF> m_pageSizes;
    QVector<Block> m_blocks;                ///< Creation order
    QHash<int, QSet<int>> m_groups;         ///< groupId -> member ids (derived)
    int m_nextBlockId = 1;
    int m_nextGroupId = 1;
};
