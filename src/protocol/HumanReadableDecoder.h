#pragma once
#include "protocol/IPacketDecoder.h"
#include "protocol/StreamSplitter.h"
#include <QtCore/QQueue>
namespace dsc {
// Type 0: "<id><data delimiter><data>" fragments separated by packet delimiters.
class HumanReadableDecoder final : public IPacketDecoder {
public:
    HumanReadableDecoder(const HumanReadableFormat& format, const QStringList& packetIds);
    void feed(QByteArrayView bytes) override;
    bool tryPopPacket(ParsedPacket& out) override;
    FormatType type() const override { return FormatType::HumanReadable; }
    void reset() override;
    int droppedCount() const override { return dropped_count_ + splitter_.overflowCount(); }
private:
    void decodeFragment(const QByteArray& fragment);
    DelimitedSplitter splitter_;
    QVector<QByteArray> data_delimiters_;
    QStringList ignore_;
    QStringList packet_ids_;
    QQueue<ParsedPacket> queue_;
    int dropped_count_ = 0;
};
}
