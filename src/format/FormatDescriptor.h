#pragma once
#include <QtCore/QMap>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariant>
#include <QtCore/QVector>
#include <functional>
#include <optional>
#include <variant>
namespace dsc {
enum class FormatType { HumanReadable = 0, PairedTokens = 1, ByteFields = 2, BitFields = 3 };
enum class HeaderField { Id, Data };
enum class XMode { Inline, Time, Index };

struct GraphDefinition {
    std::optional<QString> title;
    bool use_time = false;
    std::optional<QString> x_packet_id;
    std::optional<QString> x_axis;
    QString y_packet_id;
    std::optional<QString> y_axis;
    XMode xMode() const;
    bool operator==(const GraphDefinition& o) const;
};

struct HumanReadableFormat {
    QStringList packet_delimiters;
    QStringList data_delimiters;
    QStringList ignore;
    bool operator==(const HumanReadableFormat& o) const;
};

struct PairedTokenFormat {
    QStringList packet_delimiters;
    QStringList data_delimiters;
    QString id_specifier;
    QString data_specifier;
    bool operator==(const PairedTokenFormat& o) const;
};

// Field lengths are bytes for ByteFieldFormat and bits for BitFieldFormat.
struct FieldLayout {
    QVector<HeaderField> order;
    QVector<int> lengths;
    int totalLength() const;
    int indexOf(HeaderField field) const { return order.indexOf(field); }
    bool operator==(const FieldLayout& o) const { return order == o.order && lengths == o.lengths; }
};
struct ByteFieldFormat { FieldLayout layout; bool operator==(const ByteFieldFormat& o) const { return layout == o.layout; } };
struct BitFieldFormat { FieldLayout layout; bool operator==(const BitFieldFormat& o) const { return layout == o.layout; } };

using FormatVariant = std::variant<HumanReadableFormat, PairedTokenFormat, ByteFieldFormat, BitFieldFormat>;

struct FilterResult { bool accept = true; QVariant value; };
using FilterFunction = std::function<FilterResult(const QString& id, const QVariant& value)>;

struct FormatDescriptor {
    QString title;
    QString description;
    QString example_line;
    QStringList packet_ids;
    FormatVariant format;
    QMap<QString, GraphDefinition> graph_definitions;
    FilterFunction filter;

    FormatType type() const { return static_cast<FormatType>(format.index()); }
    bool hasPacketId(const QString& id) const { return packet_ids.contains(id); }
    // Equivalence of the parsed document; the filter hook is opaque and not compared.
    bool operator==(const FormatDescriptor& o) const;
    bool operator!=(const FormatDescriptor& o) const { return !(*this == o); }
};

// Accepts 0x-prefixed hex, 0b-prefixed binary or decimal.
bool parseIntegerLiteral(const QString& text, quint64& out);
QString renderHex(quint64 value, int byteWidth);
}
