#include "core/SeriesRouter.h"
#include <utility>
namespace dsc {
SeriesRouter::SeriesState& SeriesRouter::stateFor(const QString& seriesId) {
    auto it = states_.find(seriesId);
    if (it == states_.end()) {
        it = states_.insert(seriesId, SeriesState{});
        it->series.id = seriesId;
        order_ << seriesId;
    }
    return *it;
}

void SeriesRouter::append(SeriesState& state, const QVariant& x, const QVariant& y, QVector<Sample>& out) {
    state.series.samples.append(SeriesPoint{x, y});
    out.append(Sample{state.series.id, x, y});
}

QVector<Sample> SeriesRouter::route(const ParsedPacket& packet) {
    QVector<Sample> out;
    if (!descriptor_) return out;
    const auto& graphs = descriptor_->graph_definitions;

    // Inline index updates; samples parked for want of an index take this one.
    for (auto it = graphs.cbegin(); it != graphs.cend(); ++it) {
        const GraphDefinition& def = it.value();
        if (def.xMode() != XMode::Inline || *def.x_packet_id != packet.id || def.y_packet_id == packet.id) continue;
        last_index_.insert(it.key(), packet.value);
        auto st = states_.find(it.key());
        if (st == states_.end()) continue;
        for (const QVariant& y : std::as_const(st->pending)) append(*st, packet.value, y, out);
        st->pending.clear();
    }

    for (auto it = graphs.cbegin(); it != graphs.cend(); ++it) {
        const GraphDefinition& def = it.value();
        if (def.y_packet_id != packet.id) continue;
        SeriesState& st = stateFor(it.key());
        switch (def.xMode()) {
        case XMode::Inline:
            if (*def.x_packet_id == packet.id) append(st, packet.value, packet.value, out);
            else if (last_index_.contains(it.key())) append(st, last_index_.value(it.key()), packet.value, out);
            else st.pending.append(packet.value);
            break;
        case XMode::Time: {
            qint64 x = packet.parse_time_ns;
            if (st.last_time && x <= *st.last_time) x = *st.last_time + 1;
            st.last_time = x;
            append(st, QVariant::fromValue(x), packet.value, out);
            break;
        }
        case XMode::Index:
            append(st, QVariant::fromValue(static_cast<qint64>(st.series.samples.size())), packet.value, out);
            break;
        }
    }
    return out;
}

const Series* SeriesRouter::series(const QString& id) const {
    auto it = states_.constFind(id);
    return it == states_.constEnd() ? nullptr : &it->series;
}

int SeriesRouter::pendingCount(const QString& seriesId) const {
    auto it = states_.constFind(seriesId);
    return it == states_.constEnd() ? 0 : static_cast<int>(it->pending.size());
}

int SeriesRouter::parkedCount() const {
    int total = 0;
    for (const SeriesState& state : states_) total += static_cast<int>(state.pending.size());
    return total;
}

GraphLabels SeriesRouter::labels(const QString& seriesId) const {
    GraphLabels labels{QStringLiteral("undefined"), QStringLiteral("Packet Idx"), QStringLiteral("undefined")};
    if (!descriptor_ || !descriptor_->graph_definitions.contains(seriesId)) return labels;
    const GraphDefinition def = descriptor_->graph_definitions.value(seriesId);
    if (def.title) labels.title = *def.title;
    switch (def.xMode()) {
    case XMode::Inline: labels.x_axis = *def.x_packet_id; break;
    case XMode::Time: labels.x_axis = QStringLiteral("Time (ns)"); break;
    case XMode::Index: break;
    }
    if (def.x_axis) labels.x_axis = *def.x_axis;
    if (def.y_axis) labels.y_axis = *def.y_axis;
    return labels;
}
}
