#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rsproxy {

enum class MemberRole { UNKNOWN, PRIMARY, SECONDARY, UNREACHABLE };

[[nodiscard]] constexpr const char* member_role_name(MemberRole role) {
    switch (role) {
        case MemberRole::UNKNOWN:     return "unknown";
        case MemberRole::PRIMARY:     return "primary";
        case MemberRole::SECONDARY:   return "secondary";
        case MemberRole::UNREACHABLE: return "unreachable";
    }
    return "unknown";
}

struct ClusterMember {
    std::string address;
    MemberRole role = MemberRole::UNKNOWN;
    std::chrono::steady_clock::time_point last_seen{};
    std::chrono::microseconds rtt{0};
    uint32_t consecutive_failures = 0;
    uint32_t missing_cycles = 0;
    bool seed = false;
};

/**
 * @brief Immutable topology snapshot
 *
 * Secondaries are ordered by ascending rtt, then address. A view never holds
 * more than one primary; when probes disagree it holds none.
 */
struct ReplicaSetView {
    std::optional<ClusterMember> primary;
    std::vector<ClusterMember> secondaries;
    std::vector<ClusterMember> members;
    std::string set_name;
    uint64_t generation = 0;
    bool split_brain = false;

    [[nodiscard]] bool has_primary() const { return primary.has_value(); }

    [[nodiscard]] bool is_primary(std::string_view address) const {
        return primary && primary->address == address;
    }

    [[nodiscard]] bool is_secondary(std::string_view address) const {
        for (const auto& m : secondaries) {
            if (m.address == address) return true;
        }
        return false;
    }

    [[nodiscard]] const ClusterMember* find(std::string_view address) const {
        for (const auto& m : members) {
            if (m.address == address) return &m;
        }
        return nullptr;
    }
};

} // namespace rsproxy
