#include "protocol/StreamSplitter.h"
#include "common/logging.h"
#include <algorithm>
namespace dsc {
DelimitedSplitter::DelimitedSplitter(const QStringList& delimiters) : delimiters_(encode(delimiters)) {}

QVector<QByteArray> DelimitedSplitter::encode(const QStringList& delimiters) {
    QVector<QByteArray> out;
    for (const QString& d : delimiters) if (!d.isEmpty()) out << d.toUtf8();
    std::stable_sort(out.begin(), out.end(), [](const QByteArray& a, const QByteArray& b) { return a.size() > b.size(); });
    return out;
}

DelimiterMatch DelimitedSplitter::findFirst(QByteArrayView haystack, const QVector<QByteArray>& delimiters) {
    DelimiterMatch best;
    for (const QByteArray& d : delimiters) {
        const qsizetype pos = haystack.indexOf(QByteArrayView(d));
        if (pos < 0) continue;
        if (best.pos < 0 || pos < best.pos) best = DelimiterMatch{pos, d.size()};
    }
    return best;
}

void DelimitedSplitter::append(QByteArrayView bytes) {
    buffer_.append(bytes.data(), bytes.size());
    if (buffer_.size() > kMaxFragment && findFirst(buffer_, delimiters_).pos < 0) {
        qCDebug(lcDecoder) << "no delimiter within" << kMaxFragment << "bytes, discarding" << buffer_.size() << "bytes";
        buffer_.clear();
        ++overflow_count_;
    }
}

// True when the buffered tail starting at or before the match could still
// grow into a delimiter that would win over it.
bool DelimitedSplitter::awaitsLongerDelimiter(const DelimiterMatch& m) const {
    const qsizetype longest = delimiters_.isEmpty() ? 0 : delimiters_.first().size();
    for (qsizetype p = std::max<qsizetype>(m.pos - longest + 1, 0); p <= m.pos; ++p) {
        const QByteArrayView tail = QByteArrayView(buffer_).mid(p);
        for (const QByteArray& d : delimiters_) {
            if (tail.size() >= d.size()) continue;
            if (p == m.pos && d.size() <= m.length) continue;
            if (QByteArrayView(d).startsWith(tail)) return true;
        }
    }
    return false;
}

bool DelimitedSplitter::next(QByteArray& fragment) {
    const DelimiterMatch m = findFirst(buffer_, delimiters_);
    if (m.pos < 0 || awaitsLongerDelimiter(m)) return false;
    fragment = buffer_.left(m.pos);
    buffer_.remove(0, m.pos + m.length);
    return true;
}

FrameChunker::FrameChunker(int frameBits) : frame_bits_(std::max(frameBits, 1)) {}

bool FrameChunker::next(QByteArray& frame) {
    if (bufferedBits() < frame_bits_) return false;
    const int frameBytes = (frame_bits_ + 7) / 8;
    if (bit_offset_ % 8 == 0 && frame_bits_ % 8 == 0) {
        frame = buffer_.mid(static_cast<qsizetype>(bit_offset_ / 8), frameBytes);
    } else {
        frame = QByteArray(frameBytes, '\0');
        for (int done = 0; done < frame_bits_; done += 64) {
            const int width = std::min(64, frame_bits_ - done);
            deposit(frame, done, width, extract(buffer_, bit_offset_ + done, width));
        }
    }
    bit_offset_ += frame_bits_;
    buffer_.remove(0, static_cast<qsizetype>(bit_offset_ / 8));
    bit_offset_ %= 8;
    return true;
}

quint64 FrameChunker::extract(QByteArrayView data, qint64 bitOffset, int width) {
    quint64 v = 0;
    for (int i = 0; i < width; ++i) {
        const qint64 bit = bitOffset + i;
        const uint8_t byte = static_cast<uint8_t>(data[static_cast<qsizetype>(bit >> 3)]);
        v = (v << 1) | ((byte >> (7 - (bit & 7))) & 1u);
    }
    return v;
}

void FrameChunker::deposit(QByteArray& data, qint64 bitOffset, int width, quint64 value) {
    for (int i = 0; i < width; ++i) {
        const qint64 bit = bitOffset + i;
        const quint64 b = (value >> (width - 1 - i)) & 1u;
        char& byte = data[static_cast<qsizetype>(bit >> 3)];
        const uint8_t mask = static_cast<uint8_t>(0x80u >> (bit & 7));
        byte = static_cast<char>(b ? (static_cast<uint8_t>(byte) | mask) : (static_cast<uint8_t>(byte) & ~mask));
    }
}
}
