#include "protocol/PairedTokenDecoder.h"
#include "common/logging.h"
namespace dsc {
PairedTokenDecoder::PairedTokenDecoder(const PairedTokenFormat& format, const QStringList& packetIds)
    : splitter_(format.packet_delimiters), data_delimiters_(DelimitedSplitter::encode(format.data_delimiters)),
      id_specifier_(format.id_specifier), data_specifier_(format.data_specifier), packet_ids_(packetIds) {}

void PairedTokenDecoder::feed(QByteArrayView bytes) {
    splitter_.append(bytes);
    QByteArray token;
    while (splitter_.next(token)) decodeToken(token);
}

void PairedTokenDecoder::decodeToken(const QByteArray& token) {
    const DelimiterMatch m = DelimitedSplitter::findFirst(token, data_delimiters_);
    if (m.pos < 0) {
        if (!token.isEmpty()) { ++dropped_count_; qCDebug(lcDecoder) << "type 1: token without data delimiter" << token; }
        return;
    }
    const QString specifier = QString::fromUtf8(token.left(m.pos));
    const QString value = QString::fromUtf8(token.mid(m.pos + m.length));
    if (specifier == id_specifier_) {
        if (pending_id_) { ++dropped_count_; qCDebug(lcDecoder) << "type 1: id" << *pending_id_ << "replaced before its data arrived"; }
        pending_id_ = value;
        return;
    }
    if (specifier != data_specifier_) {
        ++dropped_count_;
        qCDebug(lcDecoder) << "type 1: unknown specifier" << specifier;
        return;
    }
    if (!pending_id_) {
        ++dropped_count_;
        qCDebug(lcDecoder) << "type 1: data token with no pending id";
        return;
    }
    const QString id = *pending_id_;
    pending_id_.reset();
    if (!packet_ids_.contains(id)) { ++dropped_count_; return; }
    queue_.enqueue(ParsedPacket{id, value});
}

bool PairedTokenDecoder::tryPopPacket(ParsedPacket& out) {
    if (queue_.isEmpty()) return false;
    out = queue_.dequeue();
    return true;
}

void PairedTokenDecoder::reset() { splitter_.reset(); pending_id_.reset(); queue_.clear(); dropped_count_ = 0; }
}
