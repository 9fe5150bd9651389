#include "ProgressAggregator.hpp"

#include <algorithm>

namespace kitzi::core::downloads {

ItemProgress ProgressAggregator::compute(const ProgressInputs& in) {
    ItemProgress out;
    out.itemId = in.itemId;
    out.totalTasks = std::max(in.totalTasks, 0);
    out.completed = std::max(in.completed, 0);

    if (out.totalTasks > 0 && out.completed >= out.totalTasks) {
        out.status = ItemStatus::Complete;
    } else if (in.blocked) {
        out.status = ItemStatus::None;
    } else if (in.anyFailedRecord || in.failed) {
        out.status = ItemStatus::Failed;
    } else if (in.anyRunningRecord || in.justQueued || in.liveActive) {
        out.status = ItemStatus::Running;
    } else if (in.inQueue || in.activated) {
        out.status = ItemStatus::Queued;
    } else {
        out.status = ItemStatus::None;
    }

    if (in.blocked) {
        out.progress = 0.0;
        return out;
    }

    double fraction = std::clamp(in.runningFraction, 0.0, 1.0);
    double denominator = static_cast<double>(std::max(out.totalTasks, 1));
    out.progress = std::clamp((out.completed + fraction) / denominator, 0.0, 1.0);

    if (out.status == ItemStatus::Running && out.progress < MIN_VISIBLE_PROGRESS) {
        out.progress = MIN_VISIBLE_PROGRESS;
    }
    return out;
}

} // namespace kitzi::core::downloads
