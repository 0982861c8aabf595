#pragma once

// ============================================================================
// ExportComposer - Crops blocks out of page rasters and merges groups
// ============================================================================
// Works only on a BlockSnapshot taken on the owner thread, plus the
// (mutex-protected) PageRasterCache, so every export entry point may run on
// a worker thread.
//
// Export units:
// - an ungrouped block: its crop
// - a group: the crops of its enabled members, in creation order, composed
//   by the MergeLayout
// Disabled blocks never contribute pixels.
// ============================================================================

#include "../core/Block.h"
#include "../core/RasterBuffer.h"
#include "MergeLayout.h"

#include <QMetaType>
#include <QString>
#include <QVector>
#include <memory>

class PageRasterCache;
struct SessionConfig;

/**
 * @brief One exported unit (single block or group).
 */
struct ExportResult {
    QString name;                       ///< "page<P>_block<ID>" or "group<G>"
    int blockId = -1;                   ///< Set for single-block units
    int groupId = Block::NoGroup;       ///< Set for group units
    BlockError error = BlockError::None;
    QString errorMessage;
    RasterBuffer buffer;                ///< Cropped or composed pixels

    bool success() const { return error == BlockError::None && buffer.isValid(); }
};

Q_DECLARE_METATYPE(ExportResult)

class ExportComposer {
public:
    /**
     * @param cache Source of page rasters (must outlive the composer).
     * @param config Provides the default export DPI and separator margin.
     * @param layout Merge policy; VerticalStackLayout if null.
     */
    ExportComposer(PageRasterCache& cache, const SessionConfig& config,
                   std::unique_ptr<MergeLayout> layout = nullptr);

    ExportComposer(const ExportComposer&) = delete;
    ExportComposer& operator=(const ExportComposer&) = delete;

    /**
     * @brief Export one block.
     * @param dpi Export resolution; <= 0 uses the page's cached DPI, or the
     *        default export DPI if the page is not cached.
     */
    ExportResult exportSingle(const BlockSnapshot& snapshot, int blockId, qreal dpi = 0) const;

    /**
     * @brief Export a group's enabled members as one merged image.
     *
     * DPI resolution follows the first enabled member's page.
     */
    ExportResult exportGroup(const BlockSnapshot& snapshot, int groupId, qreal dpi = 0) const;

    /**
     * @brief Export every unit, ordered by its first member's creation.
     * @param enabledOnly Skip units without an enabled member. When false,
     *        such units are reported as EmptyExport results.
     */
    QVector<ExportResult> exportAll(const BlockSnapshot& snapshot, bool enabledOnly = true,
                                    qreal dpi = 0) const;

    static QString blockUnitName(const Block& block);
    static QString groupUnitName(int groupId);

private:
    qreal resolveDpi(int pageIndex, qreal dpi) const;

    /**
     * @brief Crop one block out of its page raster.
     * @return False with result's error fields set on failure.
     */
    bool cropBlock(const Block& block, qreal dpi, QImage* crop, ExportResult* result) const;

    PageRasterCache& m_cache;
    const qreal m_defaultDpi;
    std::unique_ptr<MergeLayout> m_layout;
};
