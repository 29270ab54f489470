#pragma once
#include <QtCore/QByteArray>
#include <QtCore/QDeadlineTimer>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <cstdint>
namespace dsc {
enum class ConnectionState { Disconnected, Connecting, Connected, Error };
struct TransportConfig { QString portName; int baudRate = 115200; int dataBits = 8; int stopBits = 1; int parity = 0; };

// value holds a QString (types 0/1) or a quint64 (types 2/3).
struct ParsedPacket {
    QString id;
    QVariant value;
    qint64 parse_time_ns = 0;
    quint64 sequence_index = 0;
    QString text() const { return id + QStringLiteral(": ") + value.toString(); }
};

struct Sample { QString series_id; QVariant x; QVariant y; };

inline qint64 monotonicNs() { return QDeadlineTimer::current(Qt::PreciseTimer).deadlineNSecs(); }
}
Q_DECLARE_METATYPE(dsc::ParsedPacket)
Q_DECLARE_METATYPE(dsc::Sample)
