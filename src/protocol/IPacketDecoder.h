#pragma once
#include "common/types.h"
#include "format/FormatDescriptor.h"
#include <QtCore/QByteArrayView>
namespace dsc {
// Decoded packets carry id and value only; the pipeline stamps time and sequence.
class IPacketDecoder {
public:
    virtual ~IPacketDecoder() = default;
    virtual void feed(QByteArrayView bytes) = 0;
    virtual bool tryPopPacket(ParsedPacket& out) = 0;
    virtual FormatType type() const = 0;
    virtual void reset() = 0;
    virtual int droppedCount() const = 0;
};
}
