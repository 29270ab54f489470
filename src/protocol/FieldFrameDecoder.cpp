#include "protocol/FieldFrameDecoder.h"
#include "common/logging.h"
namespace {
inline int paddedBits(int bits) { return (bits + 7) & ~7; }
}
namespace dsc {
FieldFrameDecoder::FieldFrameDecoder(const FieldLayout& layout, const QStringList& packetIds, int unitBits)
    : layout_(layout), unit_bits_(unitBits), frame_bits_(paddedBits(layout.totalLength() * unitBits)),
      padding_bits_(frame_bits_ - layout.totalLength() * unitBits), chunker_(frame_bits_) {
    for (const QString& id : packetIds) {
        quint64 v = 0;
        if (parseIntegerLiteral(id, v)) ids_.append(qMakePair(v, id));
    }
}

void FieldFrameDecoder::feed(QByteArrayView bytes) {
    chunker_.append(bytes);
    QByteArray frame;
    while (chunker_.next(frame)) decodeFrame(frame);
}

void FieldFrameDecoder::decodeFrame(const QByteArray& frame) {
    quint64 id = 0;
    quint64 data = 0;
    qint64 offset = padding_bits_;
    for (int i = 0; i < layout_.order.size(); ++i) {
        const int width = layout_.lengths[i] * unit_bits_;
        const quint64 v = FrameChunker::extract(frame, offset, width);
        if (layout_.order[i] == HeaderField::Id) id = v; else data = v;
        offset += width;
    }
    for (const auto& entry : ids_) {
        if (entry.first != id) continue;
        queue_.enqueue(ParsedPacket{entry.second, QVariant::fromValue(data)});
        return;
    }
    ++dropped_count_;
    const int idBytes = (layout_.lengths[layout_.indexOf(HeaderField::Id)] * unit_bits_ + 7) / 8;
    qCDebug(lcDecoder) << "discarding frame with unknown id" << renderHex(id, idBytes);
}

QByteArray FieldFrameDecoder::buildFrame(quint64 id, quint64 data) const {
    QByteArray out(frameBytes(), '\0');
    qint64 offset = padding_bits_;
    for (int i = 0; i < layout_.order.size(); ++i) {
        const int width = layout_.lengths[i] * unit_bits_;
        FrameChunker::deposit(out, offset, width, layout_.order[i] == HeaderField::Id ? id : data);
        offset += width;
    }
    return out;
}

bool FieldFrameDecoder::tryPopPacket(ParsedPacket& out) {
    if (queue_.isEmpty()) return false;
    out = queue_.dequeue();
    return true;
}

void FieldFrameDecoder::reset() { chunker_.reset(); queue_.clear(); dropped_count_ = 0; }
}
