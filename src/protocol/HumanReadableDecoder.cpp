#include "protocol/HumanReadableDecoder.h"
#include "common/logging.h"
namespace dsc {
HumanReadableDecoder::HumanReadableDecoder(const HumanReadableFormat& format, const QStringList& packetIds)
    : splitter_(format.packet_delimiters), data_delimiters_(DelimitedSplitter::encode(format.data_delimiters)),
      ignore_(format.ignore), packet_ids_(packetIds) {}

void HumanReadableDecoder::feed(QByteArrayView bytes) {
    splitter_.append(bytes);
    QByteArray fragment;
    while (splitter_.next(fragment)) decodeFragment(fragment);
}

void HumanReadableDecoder::decodeFragment(const QByteArray& fragment) {
    const DelimiterMatch m = DelimitedSplitter::findFirst(fragment, data_delimiters_);
    const QString idPart = QString::fromUtf8(m.pos < 0 ? fragment : fragment.left(m.pos));
    if (!packet_ids_.contains(idPart)) {
        ++dropped_count_;
        qCDebug(lcDecoder) << "type 0: discarding fragment with unknown id" << idPart;
        return;
    }
    QString value = m.pos < 0 ? QString() : QString::fromUtf8(fragment.mid(m.pos + m.length));
    for (const QString& s : ignore_) value.remove(s);
    queue_.enqueue(ParsedPacket{idPart, value});
}

bool HumanReadableDecoder::tryPopPacket(ParsedPacket& out) {
    if (queue_.isEmpty()) return false;
    out = queue_.dequeue();
    return true;
}

void HumanReadableDecoder::reset() { splitter_.reset(); queue_.clear(); dropped_count_ = 0; }
}
