#include "core/ConnectionManager.h"
#include "common/logging.h"
namespace dsc {
ConnectionManager::ConnectionManager(QObject* parent) : QObject(parent) {}
void ConnectionManager::setTransport(ITransport* transport) {
    if (transport_ == transport) return;
    if (transport_) disconnect(transport_, nullptr, this, nullptr);
    transport_ = transport;
    if (transport_) {
        connect(transport_, &ITransport::bytesReceived, this, &ConnectionManager::onTransportBytes);
        connect(transport_, &ITransport::errorOccurred, this, &ConnectionManager::errorOccurred);
        connect(transport_, &ITransport::stateChanged, this, &ConnectionManager::onTransportState);
    }
}
bool ConnectionManager::open(const TransportConfig& cfg) {
    if (!transport_) { emit errorOccurred(QStringLiteral("Transport is not set")); return false; }
    return transport_->open(cfg);
}
void ConnectionManager::close() {
    // Cancel before the port closes so nothing already buffered is decoded.
    active_ = false;
    pipeline_.reset();
    if (transport_) transport_->close();
}
bool ConnectionManager::loadFormat(const QJsonObject& document, FilterFunction filter) {
    FormatDescriptor desc;
    ConfigError error;
    const bool ok = FormatValidator::parse(document, desc, error);
    return install(ok, desc, error, std::move(filter));
}
bool ConnectionManager::loadFormat(const QByteArray& json, FilterFunction filter) {
    FormatDescriptor desc;
    ConfigError error;
    const bool ok = FormatValidator::parse(json, desc, error);
    return install(ok, desc, error, std::move(filter));
}
bool ConnectionManager::install(bool ok, FormatDescriptor& desc, const ConfigError& error, FilterFunction filter) {
    if (!ok) {
        emit errorOccurred(QStringLiteral("Invalid packet format: ") + error.toString());
        return false;
    }
    desc.filter = std::move(filter);
    pipeline_.setDescriptor(std::make_shared<const FormatDescriptor>(std::move(desc)));
    emit formatLoaded();
    return true;
}
void ConnectionManager::onTransportBytes(const QByteArray& chunk) {
    emit rawReceived(chunk);
    if (!active_) return;
    pipeline_.feed(chunk);
    ParsedPacket p; while (active_ && pipeline_.tryPopPacket(p)) emit packetParsed(p);
    Sample s; while (active_ && pipeline_.tryPopSample(s)) emit sampleReady(s);
}
void ConnectionManager::onTransportState(ConnectionState state) {
    switch (state) {
    case ConnectionState::Connected: pipeline_.reset(); active_ = true; break;
    case ConnectionState::Disconnected:
    case ConnectionState::Error: active_ = false; pipeline_.reset(); break;
    case ConnectionState::Connecting: break;
    }
    emit stateChanged(state);
}
}
