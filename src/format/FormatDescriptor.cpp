#include "format/FormatDescriptor.h"
#include <numeric>
namespace dsc {
XMode GraphDefinition::xMode() const {
    if (x_packet_id) return XMode::Inline;
    if (use_time) return XMode::Time;
    return XMode::Index;
}
bool GraphDefinition::operator==(const GraphDefinition& o) const {
    return title == o.title && use_time == o.use_time && x_packet_id == o.x_packet_id && x_axis == o.x_axis
        && y_packet_id == o.y_packet_id && y_axis == o.y_axis;
}
bool HumanReadableFormat::operator==(const HumanReadableFormat& o) const {
    return packet_delimiters == o.packet_delimiters && data_delimiters == o.data_delimiters && ignore == o.ignore;
}
bool PairedTokenFormat::operator==(const PairedTokenFormat& o) const {
    return packet_delimiters == o.packet_delimiters && data_delimiters == o.data_delimiters
        && id_specifier == o.id_specifier && data_specifier == o.data_specifier;
}
int FieldLayout::totalLength() const { return std::accumulate(lengths.cbegin(), lengths.cend(), 0); }
bool FormatDescriptor::operator==(const FormatDescriptor& o) const {
    return title == o.title && description == o.description && example_line == o.example_line
        && packet_ids == o.packet_ids && format == o.format && graph_definitions == o.graph_definitions;
}
bool parseIntegerLiteral(const QString& text, quint64& out) {
    const QString t = text.trimmed().toLower();
    bool ok = false;
    quint64 v = 0;
    if (t.startsWith(QLatin1String("0x"))) v = t.mid(2).toULongLong(&ok, 16);
    else if (t.startsWith(QLatin1String("0b"))) v = t.mid(2).toULongLong(&ok, 2);
    else v = t.toULongLong(&ok, 10);
    if (!ok) return false;
    out = v;
    return true;
}
QString renderHex(quint64 value, int byteWidth) {
    return QStringLiteral("0x") + QString::number(value, 16).rightJustified(byteWidth * 2, QLatin1Char('0'));
}
}
