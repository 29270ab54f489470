#pragma once
#include "common/types.h"
#include "format/FormatDescriptor.h"
#include <memory>
namespace dsc {
// Post-decode whitelist plus the optional external filter hook.
class FilterStage {
public:
    explicit FilterStage(std::shared_ptr<const FormatDescriptor> descriptor) : descriptor_(std::move(descriptor)) {}
    // Returns false if the packet is dropped. An accepted result with an invalid
    // QVariant leaves the value unchanged.
    bool apply(ParsedPacket& packet);
    int rejectedCount() const { return rejected_count_; }
private:
    std::shared_ptr<const FormatDescriptor> descriptor_;
    int rejected_count_ = 0;
};
}
