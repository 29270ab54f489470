#pragma once
#include "protocol/IPacketDecoder.h"
#include <memory>
namespace dsc {
class DecoderFactory {
public:
    static std::unique_ptr<IPacketDecoder> create(const FormatDescriptor& descriptor);
};
}
