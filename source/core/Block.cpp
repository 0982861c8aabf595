#include "Block.h"

#include <QJsonValue>

QString blockErrorName(BlockError error)
{
    switch (error) {
        case BlockError::None:               return QStringLiteral("None");
        case BlockError::InvalidRegion:      return QStringLiteral("InvalidRegion");
        case BlockError::NotFound:           return QStringLiteral("NotFound");
        case BlockError::InvalidGroup:       return QStringLiteral("InvalidGroup");
        case BlockError::RasterizationError: return QStringLiteral("RasterizationError");
        case BlockError::EmptyExport:        return QStringLiteral("EmptyExport");
    }
    return QString();
}

QJsonObject Block::toJson() const
{
    QJsonObject rectObj;
    rectObj["x"] = rect.x();
    rectObj["y"] = rect.y();
    rectObj["width"] = rect.width();
    rectObj["height"] = rect.height();

    QJsonObject obj;
    obj["block_id"] = id;
    obj["page_index"] = pageIndex;
    obj["rect"] = rectObj;
    obj["enabled"] = enabled;
    obj["group_idx"] = isGrouped() ? QJsonValue(groupId) : QJsonValue(QJsonValue::Null);
    return obj;
}

Block Block::fromJson(const QJsonObject& obj, bool* ok)
{
    Block block;
    if (ok) *ok = false;

    // Older files used "id" instead of "block_id"
    QJsonValue idValue = obj.contains("block_id") ? obj.value("block_id") : obj.value("id");
    if (!idValue.isDouble() || !obj.value("page_index").isDouble() || !obj.value("rect").isObject()) {
        return block;
    }

    QJsonObject rectObj = obj.value("rect").toObject();
    for (const char* key : {"x", "y", "width", "height"}) {
        if (!rectObj.value(QLatin1String(key)).isDouble()) {
            return block;
        }
    }

    block.id = idValue.toInt(-1);
    block.pageIndex = obj.value("page_index").toInt(-1);
    block.rect = QRectF(rectObj.value("x").toDouble(),
                        rectObj.value("y").toDouble(),
                        rectObj.value("width").toDouble(),
                        rectObj.value("height").toDouble()).normalized();
    block.enabled = obj.value("enabled").toBool(true);

    QJsonValue groupValue = obj.value("group_idx");
    block.groupId = groupValue.isDouble() ? groupValue.toInt(NoGroup) : NoGroup;

    if (ok) *ok = block.isValid();
    return block;
}
