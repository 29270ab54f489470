#include "core/ConnectionManager.h"
#include <QtTest/QSignalSpy>
#include <QtTest/QtTest>
class FakeTransport final : public dsc::ITransport {
    Q_OBJECT
public:
    explicit FakeTransport(QObject* parent = nullptr) : dsc::ITransport(parent) {}
    bool open(const dsc::TransportConfig&) override { open_ = true; emit stateChanged(dsc::ConnectionState::Connecting); emit stateChanged(dsc::ConnectionState::Connected); return true; }
    void close() override { open_ = false; emit stateChanged(dsc::ConnectionState::Disconnected); }
    bool isOpen() const override { return open_; }
    void push(const QByteArray& chunk) { emit bytesReceived(chunk); }
    void fail() { open_ = false; emit errorOccurred(QStringLiteral("device unplugged")); emit stateChanged(dsc::ConnectionState::Error); }
private:
    bool open_ = false;
};
namespace {
const QByteArray kPairs = R"({"packet_title": "CAN over CSV", "packet_format": {"type": 1, "packet_delimiters": [";"], "data_delimiters": [":"],
    "specifiers": ["id", "data"], "packet_ids": ["temp"], "graph_definitions": {"temp": {"y": {"packet_id": "temp"}}}}})";
}
class ConnectionManagerTest : public QObject {
    Q_OBJECT
private slots:
    void startsInactiveWithoutFormat() {
        dsc::ConnectionManager mgr;
        QVERIFY(!mgr.isActive());
        QVERIFY(!mgr.format());
    }
    void openWithoutTransportReportsError() {
        dsc::ConnectionManager mgr;
        QSignalSpy errors(&mgr, &dsc::ConnectionManager::errorOccurred);
        QVERIFY(!mgr.open(dsc::TransportConfig{}));
        QCOMPARE(errors.count(), 1);
    }
    void invalidFormatKeepsPreviousOne() {
        dsc::ConnectionManager mgr;
        QVERIFY(mgr.loadFormat(kPairs));
        QSignalSpy errors(&mgr, &dsc::ConnectionManager::errorOccurred);
        QVERIFY(!mgr.loadFormat(QByteArray(R"({"type": 2, "header_order": ["ID", "DATA"], "header_len": [3], "packet_ids": ["0x1"]})")));
        QCOMPARE(errors.count(), 1);
        QVERIFY(errors.takeFirst().at(0).toString().contains(QStringLiteral("header_len")));
        QCOMPARE(mgr.format()->title, QStringLiteral("CAN over CSV"));
    }
    void emitsPacketsAndSamplesInOrder() {
        FakeTransport transport;
        dsc::ConnectionManager mgr; mgr.setTransport(&transport);
        QVERIFY(mgr.loadFormat(kPairs));
        QList<dsc::ParsedPacket> packets;
        QList<dsc::Sample> samples;
        connect(&mgr, &dsc::ConnectionManager::packetParsed, this, [&packets](const dsc::ParsedPacket& p) { packets << p; });
        connect(&mgr, &dsc::ConnectionManager::sampleReady, this, [&samples](const dsc::Sample& s) { samples << s; });
        QVERIFY(mgr.open(dsc::TransportConfig{}));
        QVERIFY(mgr.isActive());
        transport.push("id:temp;data:1");
        QCOMPARE(packets.size(), 0);
        transport.push("28;id:light;data:8000;id:temp;data:129;");
        QCOMPARE(packets.size(), 2);
        QCOMPARE(packets[0].text(), QStringLiteral("temp: 128"));
        QCOMPARE(packets[1].sequence_index, quint64(1));
        QCOMPARE(samples.size(), 2);
        QCOMPARE(samples[1].x.toLongLong(), qint64(1));
        QCOMPARE(samples[1].y.toString(), QStringLiteral("129"));
    }
    void queuedConsumerReceivesSamplesAfterDecoding() {
        FakeTransport transport;
        dsc::ConnectionManager mgr; mgr.setTransport(&transport);
        QVERIFY(mgr.loadFormat(kPairs));
        QList<dsc::ParsedPacket> packets;
        QList<dsc::Sample> samples;
        connect(&mgr, &dsc::ConnectionManager::packetParsed, this, [&packets](const dsc::ParsedPacket& p) { packets << p; }, Qt::QueuedConnection);
        connect(&mgr, &dsc::ConnectionManager::sampleReady, this, [&samples](const dsc::Sample& s) { samples << s; }, Qt::QueuedConnection);
        QVERIFY(mgr.open(dsc::TransportConfig{}));
        transport.push("id:temp;data:1;id:temp;data:2;");
        QCOMPARE(samples.size(), 0);
        QCOMPARE(mgr.pipeline().stats().samples, quint64(2));
        transport.push("id:temp;data:3;");
        QTRY_COMPARE(samples.size(), 3);
        QCOMPARE(packets.size(), 3);
        QCOMPARE(samples[0].y.toString(), QStringLiteral("1"));
        QCOMPARE(samples[2].y.toString(), QStringLiteral("3"));
        QCOMPARE(packets[2].sequence_index, quint64(2));
    }
    void bytesBeforeConnectAreOnlyEchoed() {
        FakeTransport transport;
        dsc::ConnectionManager mgr; mgr.setTransport(&transport);
        QVERIFY(mgr.loadFormat(kPairs));
        QSignalSpy raw(&mgr, &dsc::ConnectionManager::rawReceived);
        int packets = 0;
        connect(&mgr, &dsc::ConnectionManager::packetParsed, this, [&packets] { ++packets; });
        transport.push("id:temp;data:5;");
        QCOMPARE(raw.count(), 1);
        QCOMPARE(packets, 0);
    }
    void closeCancelsBufferedInput() {
        FakeTransport transport;
        dsc::ConnectionManager mgr; mgr.setTransport(&transport);
        QVERIFY(mgr.loadFormat(kPairs));
        int packets = 0;
        connect(&mgr, &dsc::ConnectionManager::packetParsed, this, [&packets] { ++packets; });
        QVERIFY(mgr.open(dsc::TransportConfig{}));
        transport.push("id:temp;");
        mgr.close();
        QVERIFY(!mgr.isActive());
        QVERIFY(mgr.open(dsc::TransportConfig{}));
        transport.push("data:5;");
        QCOMPARE(packets, 0);
        transport.push("id:temp;data:6;");
        QCOMPARE(packets, 1);
    }
    void closingFromSlotStopsRemainingEmission() {
        FakeTransport transport;
        dsc::ConnectionManager mgr; mgr.setTransport(&transport);
        QVERIFY(mgr.loadFormat(kPairs));
        int packets = 0;
        connect(&mgr, &dsc::ConnectionManager::packetParsed, this, [&] { if (++packets == 1) mgr.close(); });
        QVERIFY(mgr.open(dsc::TransportConfig{}));
        transport.push("id:temp;data:1;id:temp;data:2;id:temp;data:3;");
        QCOMPARE(packets, 1);
    }
    void transportErrorResetsState() {
        FakeTransport transport;
        dsc::ConnectionManager mgr; mgr.setTransport(&transport);
        QVERIFY(mgr.loadFormat(kPairs));
        QSignalSpy errors(&mgr, &dsc::ConnectionManager::errorOccurred);
        QVERIFY(mgr.open(dsc::TransportConfig{}));
        transport.push("id:temp;data:1;");
        QVERIFY(!mgr.pipeline().router()->seriesIds().isEmpty());
        transport.fail();
        QCOMPARE(errors.count(), 1);
        QVERIFY(!mgr.isActive());
        QVERIFY(mgr.pipeline().router()->seriesIds().isEmpty());
    }
    void reloadDiscardsSeries() {
        FakeTransport transport;
        dsc::ConnectionManager mgr; mgr.setTransport(&transport);
        QVERIFY(mgr.loadFormat(kPairs));
        QSignalSpy loaded(&mgr, &dsc::ConnectionManager::formatLoaded);
        QVERIFY(mgr.open(dsc::TransportConfig{}));
        transport.push("id:temp;data:1;id:temp;");
        QVERIFY(mgr.loadFormat(kPairs));
        QCOMPARE(loaded.count(), 1);
        QVERIFY(mgr.pipeline().router()->seriesIds().isEmpty());
        int packets = 0;
        connect(&mgr, &dsc::ConnectionManager::packetParsed, this, [&packets] { ++packets; });
        transport.push("data:2;");
        QCOMPARE(packets, 0);
    }
};
QTEST_GUILESS_MAIN(ConnectionManagerTest)
#include "test_connection_manager.moc"
