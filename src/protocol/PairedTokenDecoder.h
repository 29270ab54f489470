#pragma once
#include "protocol/IPacketDecoder.h"
#include "protocol/StreamSplitter.h"
#include <QtCore/QQueue>
#include <optional>
namespace dsc {
// Type 1: alternating "<id spec>:<id>" and "<data spec>:<value>" tokens. At most
// one id waits for its data token; a newer id replaces it.
class PairedTokenDecoder final : public IPacketDecoder {
public:
    PairedTokenDecoder(const PairedTokenFormat& format, const QStringList& packetIds);
    void feed(QByteArrayView bytes) override;
    bool tryPopPacket(ParsedPacket& out) override;
    FormatType type() const override { return FormatType::PairedTokens; }
    void reset() override;
    int droppedCount() const override { return dropped_count_ + splitter_.overflowCount(); }
    const std::optional<QString>& pendingId() const { return pending_id_; }
private:
    void decodeToken(const QByteArray& token);
    DelimitedSplitter splitter_;
    QVector<QByteArray> data_delimiters_;
    QString id_specifier_;
    QString data_specifier_;
    QStringList packet_ids_;
    std::optional<QString> pending_id_;
    QQueue<ParsedPacket> queue_;
    int dropped_count_ = 0;
};
}
