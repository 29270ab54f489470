#pragma once
#include <QtCore/QByteArray>
#include <QtCore/QByteArrayView>
#include <QtCore/QStringList>
#include <QtCore/QVector>
namespace dsc {
struct DelimiterMatch { qsizetype pos = -1; qsizetype length = 0; };

// Splits a byte stream on a set of delimiter strings. The earliest match wins;
// at equal positions the longest delimiter wins.
class DelimitedSplitter {
public:
    explicit DelimitedSplitter(const QStringList& delimiters);
    void append(QByteArrayView bytes);
    // Returns false when no complete fragment is buffered yet, including when
    // the buffered tail is the start of a longer delimiter split across chunks.
    bool next(QByteArray& fragment);
    void reset() { buffer_.clear(); overflow_count_ = 0; }
    qsizetype pendingBytes() const { return buffer_.size(); }
    int overflowCount() const { return overflow_count_; }

    static QVector<QByteArray> encode(const QStringList& delimiters);
    // `delimiters` must be sorted longest first (as returned by encode()).
    static DelimiterMatch findFirst(QByteArrayView haystack, const QVector<QByteArray>& delimiters);
    static constexpr qsizetype kMaxFragment = 64 * 1024;
private:
    bool awaitsLongerDelimiter(const DelimiterMatch& m) const;

    QVector<QByteArray> delimiters_;
    QByteArray buffer_;
    int overflow_count_ = 0;
};

// Cuts a byte stream into frames of a fixed number of bits. Bits are addressed
// MSB-first; a remainder shorter than one frame waits for the next append().
class FrameChunker {
public:
    explicit FrameChunker(int frameBits);
    void append(QByteArrayView bytes) { buffer_.append(bytes.data(), bytes.size()); }
    // On success `frame` holds ceil(frameBits / 8) bytes, left-aligned, zero-filled tail.
    bool next(QByteArray& frame);
    void reset() { buffer_.clear(); bit_offset_ = 0; }
    int frameBits() const { return frame_bits_; }
    qint64 bufferedBits() const { return static_cast<qint64>(buffer_.size()) * 8 - bit_offset_; }

    static quint64 extract(QByteArrayView data, qint64 bitOffset, int width);
    static void deposit(QByteArray& data, qint64 bitOffset, int width, quint64 value);
private:
    int frame_bits_;
    QByteArray buffer_;
    qint64 bit_offset_ = 0;
};
}
