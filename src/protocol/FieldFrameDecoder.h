#pragma once
#include "protocol/IPacketDecoder.h"
#include "protocol/StreamSplitter.h"
#include <QtCore/QPair>
#include <QtCore/QQueue>
namespace dsc {
// Shared frame logic of the binary formats. Subclasses fix the field unit and
// how a frame is padded to a whole number of bytes.
class FieldFrameDecoder : public IPacketDecoder {
public:
    void feed(QByteArrayView bytes) override;
    bool tryPopPacket(ParsedPacket& out) override;
    void reset() override;
    int droppedCount() const override { return dropped_count_; }
    int frameBytes() const { return frame_bits_ / 8; }
    qint64 bufferedBits() const { return chunker_.bufferedBits(); }
    // Encodes one frame exactly as this decoder expects to receive it.
    QByteArray buildFrame(quint64 id, quint64 data) const;
protected:
    FieldFrameDecoder(const FieldLayout& layout, const QStringList& packetIds, int unitBits);
private:
    void decodeFrame(const QByteArray& frame);
    FieldLayout layout_;
    int unit_bits_;
    int frame_bits_;
    int padding_bits_;
    QVector<QPair<quint64, QString>> ids_;
    FrameChunker chunker_;
    QQueue<ParsedPacket> queue_;
    int dropped_count_ = 0;
};

// Type 2: field lengths in bytes, big-endian.
class ByteFrameDecoder final : public FieldFrameDecoder {
public:
    ByteFrameDecoder(const ByteFieldFormat& format, const QStringList& packetIds) : FieldFrameDecoder(format.layout, packetIds, 8) {}
    FormatType type() const override { return FormatType::ByteFields; }
};

// Type 3: field lengths in bits; frames are left-padded with zero bits to a byte boundary.
class BitFrameDecoder final : public FieldFrameDecoder {
public:
    BitFrameDecoder(const BitFieldFormat& format, const QStringList& packetIds) : FieldFrameDecoder(format.layout, packetIds, 1) {}
    FormatType type() const override { return FormatType::BitFields; }
};
}
