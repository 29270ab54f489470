#include "format/FormatValidator.h"
#include "common/logging.h"
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QSet>
#include <cmath>
#include <utility>
namespace {
using namespace dsc;

class FieldReader {
public:
    FieldReader(const QJsonObject& obj, QString path, QStringList& violations) : obj_(obj), path_(std::move(path)), violations_(violations) {}
    bool has(const QString& key) const { return obj_.contains(key); }
    QString path(const QString& key) const { return path_.isEmpty() ? key : path_ + QLatin1Char('.') + key; }
    void fail(const QString& key, const QString& what) { violations_ << path(key) + QStringLiteral(": ") + what; }
    void missing(const QString& key) { fail(key, QStringLiteral("missing mandatory field")); }

    std::optional<QStringList> stringList(const QString& key, bool mandatory) {
        if (!has(key)) { if (mandatory) missing(key); return std::nullopt; }
        const QJsonValue v = obj_.value(key);
        if (!v.isArray()) { fail(key, QStringLiteral("expected an array of strings")); return std::nullopt; }
        QStringList out;
        bool ok = true;
        const QJsonArray arr = v.toArray();
        for (int i = 0; i < arr.size(); ++i) {
            if (!arr.at(i).isString() || arr.at(i).toString().isEmpty()) {
                fail(QStringLiteral("%1[%2]").arg(key).arg(i), QStringLiteral("expected a non-empty string"));
                ok = false;
                continue;
            }
            out << arr.at(i).toString();
        }
        if (!ok) return std::nullopt;
        return out;
    }
    std::optional<QString> string(const QString& key, bool mandatory = false) {
        if (!has(key)) { if (mandatory) missing(key); return std::nullopt; }
        const QJsonValue v = obj_.value(key);
        if (!v.isString()) { fail(key, QStringLiteral("expected a string")); return std::nullopt; }
        return v.toString();
    }
    std::optional<bool> boolean(const QString& key) {
        if (!has(key)) return std::nullopt;
        const QJsonValue v = obj_.value(key);
        if (!v.isBool()) { fail(key, QStringLiteral("expected a boolean")); return std::nullopt; }
        return v.toBool();
    }
    std::optional<int> integer(const QString& key, bool mandatory) {
        if (!has(key)) { if (mandatory) missing(key); return std::nullopt; }
        const QJsonValue v = obj_.value(key);
        if (!isInteger(v)) { fail(key, QStringLiteral("expected an integer")); return std::nullopt; }
        return v.toInt();
    }
    std::optional<QVector<int>> positiveIntList(const QString& key, bool mandatory) {
        if (!has(key)) { if (mandatory) missing(key); return std::nullopt; }
        const QJsonValue v = obj_.value(key);
        if (!v.isArray()) { fail(key, QStringLiteral("expected an array of positive integers")); return std::nullopt; }
        QVector<int> out;
        bool ok = true;
        const QJsonArray arr = v.toArray();
        for (int i = 0; i < arr.size(); ++i) {
            if (!isInteger(arr.at(i)) || arr.at(i).toInt() < 1) {
                fail(QStringLiteral("%1[%2]").arg(key).arg(i), QStringLiteral("expected an integer >= 1"));
                ok = false;
                continue;
            }
            out << arr.at(i).toInt();
        }
        if (!ok) return std::nullopt;
        return out;
    }
    std::optional<QJsonObject> object(const QString& key, bool mandatory) {
        if (!has(key)) { if (mandatory) missing(key); return std::nullopt; }
        const QJsonValue v = obj_.value(key);
        if (!v.isObject()) { fail(key, QStringLiteral("expected an object")); return std::nullopt; }
        return v.toObject();
    }
    void warnUnknownKeys(const QSet<QString>& known) const {
        for (const QString& key : obj_.keys())
            if (!known.contains(key)) qCWarning(lcFormat) << "ignoring unrecognised field" << path(key);
    }
    QStringList& violations() { return violations_; }
private:
    static bool isInteger(const QJsonValue& v) {
        if (!v.isDouble()) return false;
        const double d = v.toDouble();
        return std::floor(d) == d && std::abs(d) <= 2147483647.0;
    }
    const QJsonObject& obj_;
    QString path_;
    QStringList& violations_;
};

// Reads the fields owned by one format alternative.
struct FormatFieldVisitor {
    FieldReader& reader;
    const QStringList& packetIds;

    void operator()(HumanReadableFormat& f) const {
        if (auto v = reader.stringList(QStringLiteral("packet_delimiters"), true)) f.packet_delimiters = *v;
        if (auto v = reader.stringList(QStringLiteral("data_delimiters"), false)) f.data_delimiters = *v;
        if (auto v = reader.stringList(QStringLiteral("ignore"), false)) f.ignore = *v;
        nonEmpty(QStringLiteral("packet_delimiters"), f.packet_delimiters);
        reader.warnUnknownKeys(commonKeys() | QSet<QString>{QStringLiteral("packet_delimiters"), QStringLiteral("data_delimiters"), QStringLiteral("ignore")});
    }
    void operator()(PairedTokenFormat& f) const {
        if (auto v = reader.stringList(QStringLiteral("packet_delimiters"), true)) f.packet_delimiters = *v;
        if (auto v = reader.stringList(QStringLiteral("data_delimiters"), false)) f.data_delimiters = *v;
        nonEmpty(QStringLiteral("packet_delimiters"), f.packet_delimiters);
        if (auto v = reader.stringList(QStringLiteral("specifiers"), true)) {
            if (v->size() != 2) reader.fail(QStringLiteral("specifiers"), QStringLiteral("expected exactly 2 entries, got %1").arg(v->size()));
            else if (v->at(0) == v->at(1)) reader.fail(QStringLiteral("specifiers"), QStringLiteral("id and data specifiers must differ"));
            else { f.id_specifier = v->at(0); f.data_specifier = v->at(1); }
        }
        if (f.data_delimiters.isEmpty()) qCWarning(lcFormat) << "type 1 format has no data_delimiters; every token will be discarded";
        reader.warnUnknownKeys(commonKeys() | QSet<QString>{QStringLiteral("packet_delimiters"), QStringLiteral("data_delimiters"), QStringLiteral("specifiers")});
    }
    void operator()(ByteFieldFormat& f) const { readLayout(f.layout, FormatValidator::kMaxFieldBytes, QStringLiteral("bytes")); }
    void operator()(BitFieldFormat& f) const { readLayout(f.layout, FormatValidator::kMaxFieldBits, QStringLiteral("bits")); }

private:
    static QSet<QString> commonKeys() {
        return {QStringLiteral("type"), QStringLiteral("packet_ids"), QStringLiteral("graph_definitions")};
    }
    void nonEmpty(const QString& key, const QStringList& list) const {
        if (reader.has(key) && list.isEmpty() && reader.violations().filter(reader.path(key)).isEmpty())
            reader.fail(key, QStringLiteral("must not be empty"));
    }
    void readLayout(FieldLayout& layout, int maxUnits, const QString& unit) const {
        const auto order = reader.stringList(QStringLiteral("header_order"), true);
        const auto lengths = reader.positiveIntList(QStringLiteral("header_len"), true);
        if (order) {
            for (const QString& name : *order) {
                if (name == QLatin1String("ID")) layout.order << HeaderField::Id;
                else if (name == QLatin1String("DATA")) layout.order << HeaderField::Data;
                else reader.fail(QStringLiteral("header_order"), QStringLiteral("unknown header \"%1\" (expected ID or DATA)").arg(name));
            }
            if (order->count(QStringLiteral("ID")) != 1) reader.fail(QStringLiteral("header_order"), QStringLiteral("must name ID exactly once"));
            if (order->count(QStringLiteral("DATA")) != 1) reader.fail(QStringLiteral("header_order"), QStringLiteral("must name DATA exactly once"));
        }
        if (lengths) {
            layout.lengths = *lengths;
            for (int i = 0; i < lengths->size(); ++i)
                if (lengths->at(i) > maxUnits) reader.fail(QStringLiteral("header_len[%1]").arg(i), QStringLiteral("field wider than %1 %2").arg(maxUnits).arg(unit));
        }
        if (order && lengths && order->size() != lengths->size())
            reader.fail(QStringLiteral("header_len"), QStringLiteral("length %1 does not match header_order length %2").arg(lengths->size()).arg(order->size()));
        for (const QString& id : packetIds) {
            quint64 v = 0;
            if (!parseIntegerLiteral(id, v)) reader.fail(QStringLiteral("packet_ids"), QStringLiteral("\"%1\" is not an integer literal").arg(id));
        }
        reader.warnUnknownKeys(commonKeys() | QSet<QString>{QStringLiteral("header_order"), QStringLiteral("header_len")});
    }
};

void readGraphDefinitions(FieldReader& root, const QStringList& packetIds, QMap<QString, GraphDefinition>& out) {
    const auto graphs = root.object(QStringLiteral("graph_definitions"), false);
    if (!graphs) return;
    for (auto it = graphs->constBegin(); it != graphs->constEnd(); ++it) {
        const QString path = root.path(QStringLiteral("graph_definitions.") + it.key());
        if (!it.value().isObject()) { root.violations() << path + QStringLiteral(": expected an object"); continue; }
        const QJsonObject entry = it.value().toObject();
        FieldReader r(entry, path, root.violations());
        GraphDefinition def;
        def.title = r.string(QStringLiteral("title"));
        if (auto x = r.object(QStringLiteral("x"), false)) {
            FieldReader xr(*x, r.path(QStringLiteral("x")), root.violations());
            def.use_time = xr.boolean(QStringLiteral("use_time")).value_or(false);
            def.x_packet_id = xr.string(QStringLiteral("packet_id"));
            def.x_axis = xr.string(QStringLiteral("x_axis"));
            if (def.x_packet_id && !packetIds.contains(*def.x_packet_id))
                xr.fail(QStringLiteral("packet_id"), QStringLiteral("\"%1\" is not listed in packet_ids").arg(*def.x_packet_id));
        }
        if (auto y = r.object(QStringLiteral("y"), true)) {
            FieldReader yr(*y, r.path(QStringLiteral("y")), root.violations());
            if (auto id = yr.string(QStringLiteral("packet_id"), true)) {
                def.y_packet_id = *id;
                if (!packetIds.contains(*id)) yr.fail(QStringLiteral("packet_id"), QStringLiteral("\"%1\" is not listed in packet_ids").arg(*id));
            }
            def.y_axis = yr.string(QStringLiteral("y_axis"));
        }
        out.insert(it.key(), def);
    }
}
}

namespace dsc {
bool FormatValidator::parse(const QJsonObject& document, FormatDescriptor& out, ConfigError& error) {
    QStringList violations;
    QJsonObject format = document;
    FormatDescriptor desc;
    FieldReader meta(document, QString(), violations);
    if (document.contains(QStringLiteral("packet_format"))) {
        const auto inner = meta.object(QStringLiteral("packet_format"), true);
        format = inner.value_or(QJsonObject());
        desc.title = meta.string(QStringLiteral("packet_title")).value_or(QString());
        desc.description = meta.string(QStringLiteral("packet_description")).value_or(QString());
        desc.example_line = meta.string(QStringLiteral("example_line")).value_or(QString());
    }
    FieldReader reader(format, document.contains(QStringLiteral("packet_format")) ? QStringLiteral("packet_format") : QString(), violations);

    if (auto ids = reader.stringList(QStringLiteral("packet_ids"), true)) {
        desc.packet_ids = *ids;
        if (ids->isEmpty()) reader.fail(QStringLiteral("packet_ids"), QStringLiteral("must not be empty"));
    }

    const auto type = reader.integer(QStringLiteral("type"), true);
    if (type) {
        switch (*type) {
        case 0: desc.format = HumanReadableFormat{}; break;
        case 1: desc.format = PairedTokenFormat{}; break;
        case 2: desc.format = ByteFieldFormat{}; break;
        case 3: desc.format = BitFieldFormat{}; break;
        default: reader.fail(QStringLiteral("type"), QStringLiteral("unknown format type %1 (expected 0-3)").arg(*type)); break;
        }
        if (*type >= 0 && *type <= 3) std::visit(FormatFieldVisitor{reader, desc.packet_ids}, desc.format);
    }
    readGraphDefinitions(reader, desc.packet_ids, desc.graph_definitions);

    if (!violations.isEmpty()) {
        error.violations = violations;
        for (const QString& v : violations) qCWarning(lcFormat) << "config violation:" << v;
        return false;
    }
    out = std::move(desc);
    return true;
}

bool FormatValidator::parse(const QByteArray& json, FormatDescriptor& out, ConfigError& error) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        error.violations = QStringList{QStringLiteral("document: %1 at offset %2").arg(parseError.errorString()).arg(parseError.offset)};
        return false;
    }
    if (!doc.isObject()) {
        error.violations = QStringList{QStringLiteral("document: expected a JSON object")};
        return false;
    }
    return parse(doc.object(), out, error);
}
}
