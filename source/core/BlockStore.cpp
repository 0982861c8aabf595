#include "BlockStore.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QDebug>
#include <QtMath>
#include <algorithm>

namespace {
constexpr int kBlockDataVersion = 1;
}

BlockStore::BlockStore(QObject* parent)
    : QObject(parent)
{
}

// ============================================================================
// Pages
// ============================================================================

void BlockStore::setPageBounds(const QVector<QSizeF>& pageSizes)
{
    m_pageSizes = pageSizes;
}

QRectF BlockStore::pageRect(int pageIndex) const
{
    if (pageIndex < 0 || pageIndex >= m_pageSizes.size()) {
        return QRectF();
    }
    return QRectF(QPointF(0, 0), m_pageSizes[pageIndex]);
}

QRectF BlockStore::clampToPage(int pageIndex, const QRectF& rect) const
{
    QRectF bounds = pageRect(pageIndex);
    if (bounds.isEmpty()) {
        return QRectF();
    }
    if (!qIsFinite(rect.x()) || !qIsFinite(rect.y())
        || !qIsFinite(rect.width()) || !qIsFinite(rect.height())) {
        return QRectF();
    }

    QRectF clamped = rect.normalized().intersected(bounds);
    if (clamped.width() <= 0 || clamped.height() <= 0) {
        return QRectF();
    }
    return clamped;
}

// ============================================================================
// Mutation
// ============================================================================

BlockResult BlockStore::create(int pageIndex, const QRectF& rect)
{
    BlockResult result;

    if (pageIndex < 0 || pageIndex >= m_pageSizes.size()) {
        result.error = BlockError::InvalidRegion;
        result.errorMessage = tr("Page %1 does not exist").arg(pageIndex + 1);
        return result;
    }

    QRectF clamped = clampToPage(pageIndex, rect);
    if (clamped.isEmpty()) {
        result.error = BlockError::InvalidRegion;
        result.errorMessage = tr("Selection does not cover any part of page %1").arg(pageIndex + 1);
        return result;
    }

    Block block;
    block.id = m_nextBlockId++;
    block.pageIndex = pageIndex;
    block.rect = clamped;
    m_blocks.append(block);

    result.block = block;
    emit blockCreated(block);
    return result;
}

BlockResult BlockStore::toggle(int blockId)
{
    BlockResult result;
    int idx = indexOf(blockId);
    if (idx < 0) {
        result.error = BlockError::NotFound;
        result.errorMessage = tr("Block %1 not found").arg(blockId);
        return result;
    }

    Block& block = m_blocks[idx];
    block.enabled = !block.enabled;
    result.block = block;

    emit blockToggled(block.id, block.enabled);
    return result;
}

BlockResult BlockStore::remove(int blockId)
{
    BlockResult result;
    int idx = indexOf(blockId);
    if (idx < 0) {
        result.error = BlockError::NotFound;
        result.errorMessage = tr("Block %1 not found").arg(blockId);
        return result;
    }

    result.block = m_blocks.takeAt(idx);
    detachFromGroup(result.block);

    emit blockRemoved(blockId);
    return result;
}

GroupResult BlockStore::group(const QVector<int>& blockIds)
{
    GroupResult result;

    QVector<int> members;
    for (int id : blockIds) {
        if (!members.contains(id)) {
            members.append(id);
        }
    }

    if (members.size() < 2) {
        result.error = BlockError::InvalidGroup;
        result.errorMessage = tr("A group needs at least two blocks");
        return result;
    }

    for (int id : members) {
        int idx = indexOf(id);
        if (idx < 0) {
            result.error = BlockError::InvalidGroup;
            result.errorMessage = tr("Block %1 not found").arg(id);
            return result;
        }
        if (m_blocks[idx].isGrouped()) {
            result.error = BlockError::InvalidGroup;
            result.errorMessage = tr("Block %1 is already in group %2")
                                      .arg(id).arg(m_blocks[idx].groupId);
            return result;
        }
    }

    const int groupId = m_nextGroupId++;
    QSet<int>& index = m_groups[groupId];
    for (Block& block : m_blocks) {
        if (members.contains(block.id)) {
            block.groupId = groupId;
            index.insert(block.id);
            result.blockIds.append(block.id);   // creation order
        }
    }
    result.groupId = groupId;

    emit groupCreated(groupId, result.blockIds);
    return result;
}

GroupResult BlockStore::ungroup(int groupId)
{
    GroupResult result;
    if (!m_groups.contains(groupId)) {
        result.error = BlockError::NotFound;
        result.errorMessage = tr("Group %1 not found").arg(groupId);
        return result;
    }

    for (Block& block : m_blocks) {
        if (block.groupId == groupId) {
            block.groupId = Block::NoGroup;
            result.blockIds.append(block.id);
        }
    }
    m_groups.remove(groupId);
    result.groupId = groupId;

    emit groupRemoved(groupId);
    return result;
}

int BlockStore::removePage(int pageIndex)
{
    QVector<int> doomed;
    for (const Block& block : m_blocks) {
        if (block.pageIndex == pageIndex) {
            doomed.append(block.id);
        }
    }

    for (int id : doomed) {
        remove(id);
    }
    return doomed.size();
}

void BlockStore::clear()
{
    m_blocks.clear();
    m_groups.clear();
    emit blocksReset();
}

void BlockStore::detachFromGroup(const Block& block)
{
    if (!block.isGrouped()) {
        return;
    }

    auto it = m_groups.find(block.groupId);
    if (it == m_groups.end()) {
        return;
    }
    it.value().remove(block.id);
    if (it.value().isEmpty()) {
        m_groups.erase(it);
    }
}

// ============================================================================
// Queries
// ============================================================================

int BlockStore::indexOf(int blockId) const
{
    for (int i = 0; i < m_blocks.size(); ++i) {
        if (m_blocks[i].id == blockId) {
            return i;
        }
    }
    return -1;
}

QVector<Block> BlockStore::list(int pageIndex) const
{
    if (pageIndex < 0) {
        return m_blocks;
    }

    QVector<Block> result;
    for (const Block& block : m_blocks) {
        if (block.pageIndex == pageIndex) {
            result.append(block);
        }
    }
    return result;
}

Block BlockStore::block(int blockId) const
{
    int idx = indexOf(blockId);
    return idx >= 0 ? m_blocks[idx] : Block();
}

QVector<Block> BlockStore::groupMembers(int groupId) const
{
    QVector<Block> result;
    if (!m_groups.contains(groupId)) {
        return result;
    }
    for (const Block& block : m_blocks) {
        if (block.groupId == groupId) {
            result.append(block);
        }
    }
    return result;
}

QVector<int> BlockStore::groupIds() const
{
    QVector<int> ids = m_groups.keys();
    std::sort(ids.begin(), ids.end());
    return ids;
}

Block BlockStore::blockAt(int pageIndex, QPointF docPt) const
{
    // Reverse creation order: topmost first
    for (int i = m_blocks.size() - 1; i >= 0; --i) {
        const Block& block = m_blocks[i];
        if (block.pageIndex == pageIndex && block.rect.contains(docPt)) {
            return block;
        }
    }
    return Block();
}

// ============================================================================
// Persistence
// ============================================================================

QJsonObject BlockStore::toJson() const
{
    QJsonArray blocksArray;
    for (const Block& block : m_blocks) {
        blocksArray.append(block.toJson());
    }

    QJsonObject obj;
    obj["version"] = kBlockDataVersion;
    obj["next_block_id"] = m_nextBlockId;
    obj["next_group_id"] = m_nextGroupId;
    obj["blocks"] = blocksArray;
    return obj;
}

bool BlockStore::loadJson(const QJsonObject& obj, QString* errorMessage)
{
    if (!obj.value("blocks").isArray()) {
        if (errorMessage) {
            *errorMessage = tr("Not block data: missing \"blocks\" array");
        }
        return false;
    }

    int version = obj.value("version").toInt(kBlockDataVersion);
    if (version > kBlockDataVersion) {
        qWarning() << "BlockStore: Block data version" << version << "is newer than" << kBlockDataVersion;
    }

    QVector<Block> loaded;
    QSet<int> seenIds;
    int maxBlockId = 0;
    int maxGroupId = 0;

    const QJsonArray blocksArray = obj.value("blocks").toArray();
    for (const QJsonValue& value : blocksArray) {
        bool ok = false;
        Block block = Block::fromJson(value.toObject(), &ok);
        if (!ok) {
            qWarning() << "BlockStore: Skipping malformed block entry";
            continue;
        }
        if (seenIds.contains(block.id)) {
            qWarning() << "BlockStore: Skipping duplicate block id" << block.id;
            continue;
        }

        QRectF clamped = clampToPage(block.pageIndex, block.rect);
        if (clamped.isEmpty()) {
            qWarning() << "BlockStore: Skipping block" << block.id
                       << "outside page" << block.pageIndex;
            continue;
        }
        block.rect = clamped;

        seenIds.insert(block.id);
        maxBlockId = qMax(maxBlockId, block.id);
        if (block.isGrouped()) {
            maxGroupId = qMax(maxGroupId, block.groupId);
        }
        loaded.append(block);
    }

    m_blocks = loaded;
    m_groups.clear();
    for (const Block& block : m_blocks) {
        if (block.isGrouped()) {
            m_groups[block.groupId].insert(block.id);
        }
    }

    // Counters never move backwards within a session
    m_nextBlockId = qMax(m_nextBlockId, qMax(obj.value("next_block_id").toInt(1), maxBlockId + 1));
    m_nextGroupId = qMax(m_nextGroupId, qMax(obj.value("next_group_id").toInt(1), maxGroupId + 1));

    qDebug() << "BlockStore: Loaded" << m_blocks.size() << "blocks in" << m_groups.size() << "groups";
    emit blocksReset();
    return true;
}

bool BlockStore::save(const QString& path, QString* errorMessage) const
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "BlockStore: Cannot save block data to" << path << file.errorString();
        if (errorMessage) {
            *errorMessage = file.errorString();
        }
        return false;
    }

    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "BlockStore: Failed to commit" << path << file.errorString();
        if (errorMessage) {
            *errorMessage = file.errorString();
        }
        return false;
    }
    return true;
}

bool BlockStore::load(const QString& path, QString* errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = file.errorString();
        }
        return false;
    }

    QByteArray data = file.readAll();
    file.close();

    QJsonParseError parseError;
    QJsonDocument jsonDoc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !jsonDoc.isObject()) {
        qWarning() << "BlockStore: Block data parse error in" << path << parseError.errorString();
        if (errorMessage) {
            *errorMessage = parseError.errorString();
        }
        return false;
    }

    return loadJson(jsonDoc.object(), errorMessage);
}
