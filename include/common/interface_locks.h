#ifndef PAW_INTERFACE_LOCKS_H
#define PAW_INTERFACE_LOCKS_H

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace paw {

// Serializes mode switches and session starts that target the same interface.
class InterfaceLocks {
public:
    InterfaceLocks() = default;

    std::unique_lock<std::mutex> acquire(const std::string& interface);

private:
    InterfaceLocks(const InterfaceLocks&) = delete;
    InterfaceLocks& operator=(const InterfaceLocks&) = delete;

    std::mutex table_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> locks_;
};

} // namespace paw

#endif // PAW_INTERFACE_LOCKS_H
