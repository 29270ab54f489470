#include "protocol/DecoderFactory.h"
#include "protocol/FieldFrameDecoder.h"
#include "protocol/HumanReadableDecoder.h"
#include "protocol/PairedTokenDecoder.h"
namespace {
using namespace dsc;
struct DecoderBuilder {
    const QStringList& ids;
    std::unique_ptr<IPacketDecoder> operator()(const HumanReadableFormat& f) const { return std::make_unique<HumanReadableDecoder>(f, ids); }
    std::unique_ptr<IPacketDecoder> operator()(const PairedTokenFormat& f) const { return std::make_unique<PairedTokenDecoder>(f, ids); }
    std::unique_ptr<IPacketDecoder> operator()(const ByteFieldFormat& f) const { return std::make_unique<ByteFrameDecoder>(f, ids); }
    std::unique_ptr<IPacketDecoder> operator()(const BitFieldFormat& f) const { return std::make_unique<BitFrameDecoder>(f, ids); }
};
}
namespace dsc {
std::unique_ptr<IPacketDecoder> DecoderFactory::create(const FormatDescriptor& descriptor) {
    return std::visit(DecoderBuilder{descriptor.packet_ids}, descriptor.format);
}
}
