#include "core/ConnectionManager.h"
#include "transport/SerialTransport.h"
#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QFile>
#include <QtCore/QTextStream>
int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("device_serial_capture"));
    QCommandLineParser cli;
    cli.setApplicationDescription(QStringLiteral("Decode a serial instrument stream into plottable samples."));
    cli.addHelpOption();
    const QCommandLineOption portOpt(QStringList{"p", "port"}, "Serial port name.", "port");
    const QCommandLineOption baudOpt(QStringList{"b", "baud"}, "Baud rate.", "baud", "115200");
    const QCommandLineOption formatOpt(QStringList{"f", "format"}, "Packet format JSON file.", "file");
    const QCommandLineOption rawOpt("raw", "Echo raw bytes instead of samples.");
    const QCommandLineOption listOpt("list-ports", "List serial ports and exit.");
    cli.addOptions({portOpt, baudOpt, formatOpt, rawOpt, listOpt});
    cli.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);
    if (cli.isSet(listOpt)) {
        for (const QString& port : dsc::SerialTransport::availablePorts()) out << port << Qt::endl;
        return 0;
    }
    if (!cli.isSet(portOpt)) { err << "missing --port" << Qt::endl; return 2; }

    dsc::SerialTransport transport;
    dsc::ConnectionManager conn; conn.setTransport(&transport);
    QObject::connect(&conn, &dsc::ConnectionManager::errorOccurred, &app, [&err](const QString& e) { err << e << Qt::endl; });

    if (cli.isSet(formatOpt)) {
        QFile file(cli.value(formatOpt));
        if (!file.open(QIODevice::ReadOnly)) { err << "cannot read " << file.fileName() << ": " << file.errorString() << Qt::endl; return 2; }
        if (!conn.loadFormat(file.readAll())) return 2;
    }
    if (cli.isSet(rawOpt) || !conn.format()) {
        QObject::connect(&conn, &dsc::ConnectionManager::rawReceived, &app, [&out](const QByteArray& chunk) { out << QString::fromUtf8(chunk); out.flush(); });
    } else {
        QObject::connect(&conn, &dsc::ConnectionManager::sampleReady, &app, [&out](const dsc::Sample& s) {
            out << s.series_id << '\t' << s.x.toString() << '\t' << s.y.toString() << Qt::endl;
        }, Qt::QueuedConnection);
    }
    QObject::connect(&conn, &dsc::ConnectionManager::stateChanged, &app, [](dsc::ConnectionState st) {
        if (st == dsc::ConnectionState::Disconnected || st == dsc::ConnectionState::Error) QCoreApplication::exit(st == dsc::ConnectionState::Error ? 1 : 0);
    });

    bool baudOk = false;
    dsc::TransportConfig cfg; cfg.portName = cli.value(portOpt); cfg.baudRate = cli.value(baudOpt).toInt(&baudOk);
    if (!baudOk || cfg.baudRate <= 0) { err << "invalid --baud " << cli.value(baudOpt) << Qt::endl; return 2; }
    if (!conn.open(cfg)) return 1;
    return app.exec();
}
