#include "core/FilterStage.h"
#include "common/logging.h"
#include <exception>
namespace dsc {
bool FilterStage::apply(ParsedPacket& packet) {
    if (!descriptor_ || !descriptor_->hasPacketId(packet.id)) {
        ++rejected_count_;
        qCDebug(lcPipeline) << "stale packet id" << packet.id << "not in active format";
        return false;
    }
    if (!descriptor_->filter) return true;
    FilterResult result;
    try {
        result = descriptor_->filter(packet.id, packet.value);
    } catch (const std::exception& e) {
        ++rejected_count_;
        qCWarning(lcPipeline) << "filter function failed on" << packet.id << ":" << e.what();
        return false;
    } catch (...) {
        ++rejected_count_;
        qCWarning(lcPipeline) << "filter function failed on" << packet.id << "with a non-standard exception";
        return false;
    }
    if (!result.accept) {
        ++rejected_count_;
        qCDebug(lcPipeline) << "filter rejected" << packet.text();
        return false;
    }
    if (result.value.isValid()) packet.value = result.value;
    return true;
}
}
