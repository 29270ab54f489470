#pragma once
#include "common/types.h"
#include "format/FormatDescriptor.h"
#include <QtCore/QMap>
#include <QtCore/QVector>
#include <memory>
#include <optional>
namespace dsc {
struct SeriesPoint { QVariant x; QVariant y; };
struct Series { QString id; QVector<SeriesPoint> samples; };
struct GraphLabels { QString title; QString x_axis; QString y_axis; };

// Assigns accepted packets to graph series and computes their x coordinate.
// Inline-mode samples wait in an unbounded per-series buffer until their index
// packet arrives; a stream that never sends it grows memory, see parkedCount().
class SeriesRouter {
public:
    explicit SeriesRouter(std::shared_ptr<const FormatDescriptor> descriptor) : descriptor_(std::move(descriptor)) {}
    QVector<Sample> route(const ParsedPacket& packet);
    const Series* series(const QString& id) const;
    // Series in creation order.
    QStringList seriesIds() const { return order_; }
    GraphLabels labels(const QString& seriesId) const;
    int pendingCount(const QString& seriesId) const;
    // Samples waiting for an index value, summed over all series.
    int parkedCount() const;
    void reset() { states_.clear(); last_index_.clear(); order_.clear(); }
private:
    struct SeriesState {
        Series series;
        QVector<QVariant> pending;
        std::optional<qint64> last_time;
    };
    SeriesState& stateFor(const QString& seriesId);
    void append(SeriesState& state, const QVariant& x, const QVariant& y, QVector<Sample>& out);
    std::shared_ptr<const FormatDescriptor> descriptor_;
    QMap<QString, SeriesState> states_;
    QMap<QString, QVariant> last_index_;
    QStringList order_;
};
}
