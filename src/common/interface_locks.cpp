#include "common/interface_locks.h"

namespace paw {

std::unique_lock<std::mutex> InterfaceLocks::acquire(const std::string& interface) {
    std::mutex* target = nullptr;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        auto& slot = locks_[interface];
        if (!slot) {
            slot = std::make_unique<std::mutex>();
        }
        target = slot.get();
    }
    // Entries are never erased, so the pointer stays valid
    return std::unique_lock<std::mutex>(*target);
}

} // namespace paw
