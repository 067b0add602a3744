#include "generator/hardware_address.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

#include <ifaddrs.h>
#include <net/if.h>
#include <sys/socket.h>
#include <sys/types.h>
#ifdef __APPLE__
#include <net/if_dl.h>
#else
#include <linux/if_packet.h>
#endif

namespace uuidpp {

namespace {

bool all_zero(const unsigned char* addr, size_t length) {
    return std::all_of(addr, addr + length, [](unsigned char b) { return b == 0; });
}

} // anonymous namespace

std::optional<NodeAddress> find_hardware_address() {
    struct ifaddrs* ifap = nullptr;

    if (getifaddrs(&ifap) != 0) {
        log_event(LogLevel::Warning, "HardwareAddress",
                  std::string("getifaddrs failed: ") + std::strerror(errno));
        return std::nullopt;
    }

    std::optional<NodeAddress> found;
    for (struct ifaddrs* ifa = ifap; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr) continue;

#ifdef __APPLE__
        if (ifa->ifa_addr->sa_family != AF_LINK) continue;
        auto* sdl = reinterpret_cast<struct sockaddr_dl*>(ifa->ifa_addr);
        const auto* addr = reinterpret_cast<const unsigned char*>(LLADDR(sdl));
        const size_t length = sdl->sdl_alen;
#else
        if (ifa->ifa_addr->sa_family != AF_PACKET) continue;
        auto* sll = reinterpret_cast<struct sockaddr_ll*>(ifa->ifa_addr);
        const auto* addr = sll->sll_addr;
        const size_t length = sll->sll_halen;
#endif

        // Loopback and unconfigured interfaces report an all-zero address
        if (length < 6 || all_zero(addr, length)) continue;

        NodeAddress node;
        std::copy(addr, addr + node.size(), node.begin());
        log_event(LogLevel::Debug, "HardwareAddress",
                  std::string("using interface ") + ifa->ifa_name);
        found = node;
        break;
    }

    freeifaddrs(ifap);
    return found;
}

} // namespace uuidpp
