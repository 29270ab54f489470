#pragma once
#include "core/FilterStage.h"
#include "core/SeriesRouter.h"
#include "protocol/IPacketDecoder.h"
#include <QtCore/QQueue>
#include <functional>
#include <memory>
namespace dsc {
struct PipelineStats {
    quint64 decoded = 0;
    quint64 accepted = 0;
    quint64 samples = 0;
    int dropped = 0;
    int rejected = 0;
    // Inline-mode samples still waiting for their index packet.
    int parked = 0;
};

// decode -> filter -> route for one connection. Output queues are unbounded:
// a slow consumer costs memory, never samples.
class PacketPipeline {
public:
    using Clock = std::function<qint64()>;
    explicit PacketPipeline(Clock clock = monotonicNs);
    ~PacketPipeline();
    // Replaces the descriptor and discards every piece of decoder and series state.
    void setDescriptor(std::shared_ptr<const FormatDescriptor> descriptor);
    std::shared_ptr<const FormatDescriptor> descriptor() const { return descriptor_; }
    void feed(QByteArrayView bytes);
    bool tryPopPacket(ParsedPacket& out);
    bool tryPopSample(Sample& out);
    // Disconnect: stops decoding and drops buffered input and state.
    void reset();
    const SeriesRouter* router() const { return router_.get(); }
    PipelineStats stats() const;
private:
    void rebuild();
    Clock clock_;
    std::shared_ptr<const FormatDescriptor> descriptor_;
    std::unique_ptr<IPacketDecoder> decoder_;
    std::unique_ptr<FilterStage> filter_;
    std::unique_ptr<SeriesRouter> router_;
    QQueue<ParsedPacket> packets_;
    QQueue<Sample> samples_;
    quint64 next_sequence_ = 0;
    PipelineStats stats_;
};
}
