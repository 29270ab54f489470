#pragma once
#include "core/PacketPipeline.h"
#include "format/FormatValidator.h"
#include "transport/ITransport.h"
#include <QtCore/QJsonObject>
#include <QtCore/QObject>
namespace dsc {
// Consumers of packetParsed and sampleReady should connect with
// Qt::QueuedConnection: a same-thread AutoConnection runs the slot inside the
// decode loop and a slow slot then stalls the serial stream.
class ConnectionManager : public QObject {
    Q_OBJECT
public:
    explicit ConnectionManager(QObject* parent = nullptr);
    void setTransport(ITransport* transport);
    bool open(const TransportConfig& cfg);
    void close();
    bool isActive() const { return active_; }
    // Swaps in a new packet format atomically. On failure the active format stays.
    bool loadFormat(const QJsonObject& document, FilterFunction filter = {});
    bool loadFormat(const QByteArray& json, FilterFunction filter = {});
    std::shared_ptr<const FormatDescriptor> format() const { return pipeline_.descriptor(); }
    const PacketPipeline& pipeline() const { return pipeline_; }
signals:
    void rawReceived(const QByteArray& chunk);
    void packetParsed(const dsc::ParsedPacket& packet);
    void sampleReady(const dsc::Sample& sample);
    void formatLoaded();
    void errorOccurred(const QString& error);
    void stateChanged(dsc::ConnectionState state);
private slots:
    void onTransportBytes(const QByteArray& chunk);
    void onTransportState(dsc::ConnectionState state);
private:
    bool install(bool ok, FormatDescriptor& desc, const ConfigError& error, FilterFunction filter);
    ITransport* transport_ = nullptr;
    PacketPipeline pipeline_;
    bool active_ = false;
};
}
