#pragma once

// ============================================================================
// Block - A user-defined rectangular region of interest on one page
// ============================================================================
// Block is a pure data struct. All mutation goes through BlockStore, which
// owns the authoritative copy and the group index.
//
// Coordinates are in document space: PDF points (1/72 inch), relative to the
// top-left corner of the owning page, y growing downwards.
// ============================================================================

#include <QRectF>
#include <QString>
#include <QVector>
#include <QJsonObject>
#include <QMetaType>

/**
 * @brief Error kinds reported by the block selection and export subsystem.
 *
 * None of these are fatal. Store/controller errors abort only the offending
 * command; raster errors abort only the affected export unit.
 */
enum class BlockError {
    None,
    InvalidRegion,          ///< Degenerate or out-of-page rectangle
    NotFound,               ///< Stale block or group id
    InvalidGroup,           ///< Malformed grouping request
    RasterizationError,     ///< External rasterizer failed (page + cause in message)
    EmptyExport             ///< Export unit has no enabled members
};

/**
 * @brief Human-readable name of an error kind (for logs and notices).
 */
QString blockErrorName(BlockError error);

/**
 * @brief A rectangular region of interest on a single page.
 */
struct Block {
    static constexpr int NoGroup = -1;

    int id = -1;                ///< Stable unique id, never reused in a session
    int pageIndex = -1;         ///< Owning page (0-based), immutable
    QRectF rect;                ///< Region in document space (points)
    bool enabled = true;        ///< Disabled blocks are never exported
    int groupId = NoGroup;      ///< Export group, or NoGroup

    bool isValid() const { return id >= 0 && pageIndex >= 0; }
    bool isGrouped() const { return groupId != NoGroup; }

    // ===== Serialization =====

    /**
     * @brief Serialize to the persisted block-data format.
     *
     * The group is written as "group_idx" (null when ungrouped).
     */
    QJsonObject toJson() const;

    /**
     * @brief Parse a block from the persisted format.
     * @param obj JSON object as written by toJson().
     * @param ok Set to false if a required field is missing or malformed.
     */
    static Block fromJson(const QJsonObject& obj, bool* ok = nullptr);
};

/**
 * @brief Immutable copy of the block list, in creation order.
 *
 * Taken on the owner thread before any export work starts so export
 * workers never read the live store.
 */
using BlockSnapshot = QVector<Block>;

/**
 * @brief Result of a single-block store operation (create/toggle/remove).
 */
struct BlockResult {
    BlockError error = BlockError::None;
    QString errorMessage;
    Block block;                ///< Affected block (state after the operation)

    bool success() const { return error == BlockError::None; }
};

/**
 * @brief Result of a group/ungroup operation.
 */
struct GroupResult {
    BlockError error = BlockError::None;
    QString errorMessage;
    int groupId = Block::NoGroup;
    QVector<int> blockIds;      ///< Members, in creation order

    bool success() const { return error == BlockError::None; }
};

Q_DECLARE_METATYPE(Block)
