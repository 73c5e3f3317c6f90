/// @file src/forecast/model_handle.cpp
/// @brief ModelHandle — mutex-guarded publish/snapshot of the current model.

#include "buylimit/forecast.hpp"

#include <utility>

namespace buylimit::forecast {

std::shared_ptr<const AllocationModel> ModelHandle::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_;
}

void ModelHandle::publish(std::shared_ptr<const AllocationModel> model) {
    std::lock_guard<std::mutex> lock(mutex_);
    model_ = std::move(model);
}

void ModelHandle::clear() {
    // Release outside the lock: the last reference may free a large model.
    std::shared_ptr<const AllocationModel> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released.swap(model_);
    }
}

}  // namespace buylimit::forecast
