#include "core/types/Host.hpp"

namespace hostwake::core {

std::string Host::statusToString() const {
    switch (status) {
    case HostStatus::Online:
        return "online";
    case HostStatus::Offline:
        return "offline";
    case HostStatus::Error:
        return "error";
    }
    return "offline";
}

HostStatus Host::statusFromString(const std::string& str) {
    if (str == "online")
        return HostStatus::Online;
    if (str == "error")
        return HostStatus::Error;
    return HostStatus::Offline;
}

} // namespace hostwake::core
