#include "transport/SerialTransport.h"
#include "common/logging.h"
#include <QtSerialPort/QSerialPortInfo>
namespace dsc {
SerialTransport::SerialTransport(QObject* parent) : ITransport(parent) {
    QObject::connect(&serial_, &QSerialPort::readyRead, this, &SerialTransport::onReadyRead);
    QObject::connect(&serial_, &QSerialPort::errorOccurred, this, [this](QSerialPort::SerialPortError err) {
        if (err == QSerialPort::NoError) return;
        qCWarning(lcTransport) << "serial error on" << serial_.portName() << ":" << serial_.errorString();
        emit errorOccurred(serial_.errorString());
        if (err == QSerialPort::ResourceError && serial_.isOpen()) serial_.close();
        emit stateChanged(ConnectionState::Error);
    });
}
bool SerialTransport::open(const TransportConfig& config) {
    if (serial_.isOpen()) close();
    serial_.setPortName(config.portName);
    serial_.setBaudRate(config.baudRate);
    serial_.setDataBits(static_cast<QSerialPort::DataBits>(config.dataBits));
    serial_.setStopBits(config.stopBits == 2 ? QSerialPort::TwoStop : QSerialPort::OneStop);
    serial_.setParity(static_cast<QSerialPort::Parity>(config.parity));
    emit stateChanged(ConnectionState::Connecting);
    if (!serial_.open(QIODevice::ReadOnly)) {
        emit errorOccurred(serial_.errorString());
        emit stateChanged(ConnectionState::Error);
        return false;
    }
    qCInfo(lcTransport) << "opened" << config.portName << "at" << config.baudRate << "baud";
    emit stateChanged(ConnectionState::Connected);
    return true;
}
void SerialTransport::close() {
    if (serial_.isOpen()) { serial_.close(); qCInfo(lcTransport) << "closed" << serial_.portName(); }
    emit stateChanged(ConnectionState::Disconnected);
}
bool SerialTransport::isOpen() const { return serial_.isOpen(); }
void SerialTransport::onReadyRead() {
    const QByteArray chunk = serial_.readAll();
    if (!chunk.isEmpty()) emit bytesReceived(chunk);
}
QStringList SerialTransport::availablePorts() {
    QStringList out;
    for (const QSerialPortInfo& info : QSerialPortInfo::availablePorts()) out << info.portName();
    return out;
}
}
