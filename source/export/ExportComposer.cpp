#include "ExportComposer.h"
#include "../core/CoordinateMapper.h"
#include "../core/PageRasterCache.h"
#include "../core/SessionConfig.h"

#include <QCoreApplication>
#include <QDebug>
#include <QSet>

ExportComposer::ExportComposer(PageRasterCache& cache, const SessionConfig& config,
                               std::unique_ptr<MergeLayout> layout)
    : m_cache(cache)
    , m_defaultDpi(config.exportDpi)
    , m_layout(std::move(layout))
{
    if (!m_layout) {
        m_layout = std::make_unique<VerticalStackLayout>(config.separatorMargin);
    }
}

QString ExportComposer::blockUnitName(const Block& block)
{
    return QStringLiteral("page%1_block%2").arg(block.pageIndex + 1).arg(block.id);
}

QString ExportComposer::groupUnitName(int groupId)
{
    return QStringLiteral("group%1").arg(groupId);
}

qreal ExportComposer::resolveDpi(int pageIndex, qreal dpi) const
{
    if (dpi > 0) {
        return dpi;
    }
    qreal cachedDpi = m_cache.cachedDpi(pageIndex);
    return cachedDpi > 0 ? cachedDpi : m_defaultDpi;
}

bool ExportComposer::cropBlock(const Block& block, qreal dpi, QImage* crop, ExportResult* result) const
{
    RasterResult raster = m_cache.ensure(block.pageIndex, dpi);
    if (!raster.success()) {
        result->error = raster.error;
        result->errorMessage = raster.errorMessage;
        return false;
    }

    const QImage& page = raster.buffer.image;
    // Origin and size are rounded separately so the crop size depends only on the block size.
    const QRectF scaled = CoordinateMapper::toRaster(block.rect, dpi);
    QRect cropRect = QRect(qRound(scaled.x()), qRound(scaled.y()),
                           qRound(scaled.width()), qRound(scaled.height()))
                         .intersected(page.rect());
    if (cropRect.isEmpty()) {
        result->error = BlockError::InvalidRegion;
        result->errorMessage = QCoreApplication::translate("ExportComposer",
                                   "Block %1 lies outside page %2")
                                   .arg(block.id).arg(block.pageIndex + 1);
        return false;
    }

    *crop = page.copy(cropRect);
    return true;
}

// ============================================================================
// Export units
// ============================================================================

ExportResult ExportComposer::exportSingle(const BlockSnapshot& snapshot, int blockId, qreal dpi) const
{
    ExportResult result;
    result.blockId = blockId;

    const Block* block = nullptr;
    for (const Block& candidate : snapshot) {
        if (candidate.id == blockId) {
            block = &candidate;
            break;
        }
    }

    if (!block) {
        result.name = QStringLiteral("block%1").arg(blockId);
        result.error = BlockError::NotFound;
        result.errorMessage = QCoreApplication::translate("ExportComposer", "Block %1 not found").arg(blockId);
        return result;
    }

    result.name = blockUnitName(*block);
    result.groupId = block->groupId;

    if (!block->enabled) {
        result.error = BlockError::EmptyExport;
        result.errorMessage = QCoreApplication::translate("ExportComposer", "Block %1 is disabled").arg(blockId);
        return result;
    }

    const qreal exportDpi = resolveDpi(block->pageIndex, dpi);
    QImage crop;
    if (!cropBlock(*block, exportDpi, &crop, &result)) {
        qWarning() << "ExportComposer:" << result.name << "failed:" << result.errorMessage;
        return result;
    }

    result.buffer.pageIndex = block->pageIndex;
    result.buffer.dpi = exportDpi;
    result.buffer.image = crop;
    return result;
}

ExportResult ExportComposer::exportGroup(const BlockSnapshot& snapshot, int groupId, qreal dpi) const
{
    ExportResult result;
    result.name = groupUnitName(groupId);
    result.groupId = groupId;

    QVector<Block> enabledMembers;
    bool anyMember = false;
    for (const Block& block : snapshot) {
        if (block.groupId != groupId || groupId == Block::NoGroup) {
            continue;
        }
        anyMember = true;
        if (block.enabled) {
            enabledMembers.append(block);
        }
    }

    if (!anyMember) {
        result.error = BlockError::NotFound;
        result.errorMessage = QCoreApplication::translate("ExportComposer", "Group %1 not found").arg(groupId);
        return result;
    }
    if (enabledMembers.isEmpty()) {
        result.error = BlockError::EmptyExport;
        result.errorMessage = QCoreApplication::translate("ExportComposer",
                                  "Group %1 has no enabled blocks").arg(groupId);
        return result;
    }

    const qreal exportDpi = resolveDpi(enabledMembers.first().pageIndex, dpi);

    QVector<QImage> segments;
    segments.reserve(enabledMembers.size());
    for (const Block& member : enabledMembers) {
        QImage crop;
        if (!cropBlock(member, exportDpi, &crop, &result)) {
            qWarning() << "ExportComposer:" << result.name << "failed at block" << member.id
                       << ":" << result.errorMessage;
            return result;
        }
        segments.append(crop);
    }

    result.buffer.pageIndex = enabledMembers.first().pageIndex;
    result.buffer.dpi = exportDpi;
    result.buffer.image = m_layout->compose(segments);
    return result;
}

QVector<ExportResult> ExportComposer::exportAll(const BlockSnapshot& snapshot, bool enabledOnly,
                                                qreal dpi) const
{
    QVector<ExportResult> results;
    QSet<int> seenGroups;

    // Units appear in the order of their first member.
    for (const Block& block : snapshot) {
        if (block.isGrouped()) {
            if (seenGroups.contains(block.groupId)) {
                continue;
            }
            seenGroups.insert(block.groupId);

            if (enabledOnly) {
                bool anyEnabled = false;
                for (const Block& other : snapshot) {
                    if (other.groupId == block.groupId && other.enabled) {
                        anyEnabled = true;
                        break;
                    }
                }
                if (!anyEnabled) {
                    continue;
                }
            }
            results.append(exportGroup(snapshot, block.groupId, dpi));
        } else {
            if (enabledOnly && !block.enabled) {
                continue;
            }
            results.append(exportSingle(snapshot, block.id, dpi));
        }
    }

    int failed = 0;
    for (const ExportResult& result : results) {
        if (!result.success()) {
            ++failed;
        }
    }
    qDebug() << "ExportComposer: Exported" << results.size() - failed << "of" << results.size() << "units";
    return results;
}
