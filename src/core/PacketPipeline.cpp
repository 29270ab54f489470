#include "core/PacketPipeline.h"
#include "common/logging.h"
#include "protocol/DecoderFactory.h"
namespace dsc {
PacketPipeline::PacketPipeline(Clock clock) : clock_(std::move(clock)) {}
PacketPipeline::~PacketPipeline() = default;

void PacketPipeline::setDescriptor(std::shared_ptr<const FormatDescriptor> descriptor) {
    descriptor_ = std::move(descriptor);
    rebuild();
    if (descriptor_) qCInfo(lcPipeline) << "format loaded: type" << static_cast<int>(descriptor_->type()) << "ids" << descriptor_->packet_ids;
}

void PacketPipeline::rebuild() {
    decoder_.reset();
    filter_.reset();
    router_.reset();
    packets_.clear();
    samples_.clear();
    next_sequence_ = 0;
    stats_ = PipelineStats{};
    if (!descriptor_) return;
    decoder_ = DecoderFactory::create(*descriptor_);
    filter_ = std::make_unique<FilterStage>(descriptor_);
    router_ = std::make_unique<SeriesRouter>(descriptor_);
}

void PacketPipeline::reset() { rebuild(); }

void PacketPipeline::feed(QByteArrayView bytes) {
    if (!decoder_ || bytes.isEmpty()) return;
    decoder_->feed(bytes);
    ParsedPacket packet;
    while (decoder_->tryPopPacket(packet)) {
        ++stats_.decoded;
        packet.parse_time_ns = clock_();
        if (!filter_->apply(packet)) continue;
        packet.sequence_index = next_sequence_++;
        ++stats_.accepted;
        packets_.enqueue(packet);
        for (const Sample& s : router_->route(packet)) { samples_.enqueue(s); ++stats_.samples; }
    }
}

bool PacketPipeline::tryPopPacket(ParsedPacket& out) {
    if (packets_.isEmpty()) return false;
    out = packets_.dequeue();
    return true;
}

bool PacketPipeline::tryPopSample(Sample& out) {
    if (samples_.isEmpty()) return false;
    out = samples_.dequeue();
    return true;
}

PipelineStats PacketPipeline::stats() const {
    PipelineStats s = stats_;
    if (decoder_) s.dropped = decoder_->droppedCount();
    if (filter_) s.rejected = filter_->rejectedCount();
    if (router_) s.parked = router_->parkedCount();
    return s;
}
}
