#pragma once
#include "common/types.h"
#include <QtCore/QObject>
namespace dsc {
// Upstream byte source. Chunks arrive through bytesReceived in arrival order;
// stateChanged(Disconnected) ends the stream.
class ITransport : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~ITransport() override = default;
    virtual bool open(const TransportConfig& config) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
signals:
    void bytesReceived(const QByteArray& chunk);
    void errorOccurred(const QString& message);
    void stateChanged(dsc::ConnectionState state);
};
}
