#pragma once

// ============================================================================
// MergeLayout - How group segments are composed into one image
// ============================================================================

#include <QImage>
#include <QVector>

/**
 * @brief Policy that arranges cropped segments into a single image.
 *
 * Implementations must be pure: compose() runs on export worker threads.
 */
class MergeLayout {
public:
    virtual ~MergeLayout() = default;

    /**
     * @brief Compose segments, in order, into one image.
     * @return Null QImage if segments is empty.
     */
    virtual QImage compose(const QVector<QImage>& segments) const = 0;
};

/**
 * @brief Stacks segments top to bottom, left aligned, on white.
 *
 * Width is the widest segment; height is the sum of heights plus the
 * margin between consecutive segments. A lone segment is returned as is.
 */
class VerticalStackLayout : public MergeLayout {
public:
    explicit VerticalStackLayout(int margin = 16);

    int margin() const { return m_margin; }

    QImage compose(const QVector<QImage>& segments) const override;

private:
    int m_margin;
};
