#pragma once
#include "transport/ITransport.h"
#include <QtSerialPort/QSerialPort>
#include <QtCore/QStringList>
namespace dsc {
class SerialTransport final : public ITransport {
    Q_OBJECT
public:
    explicit SerialTransport(QObject* parent = nullptr);
    bool open(const TransportConfig& config) override;
    void close() override;
    bool isOpen() const override;
    static QStringList availablePorts();
private slots:
    void onReadyRead();
private:
    QSerialPort serial_;
};
}
