#pragma once
#include "nostr/event.pb.h"
#include <cstdint>
#include <initializer_list>
#include <string_view>
namespace contextvm::protocol {

/// Filter for RPC traffic addressed to @p pubkey: kinds 25910 and 1059
/// carrying a matching `p` tag.
[[nodiscard]] proto::nostr::Filter MakeInboundFilter(std::string_view pubkey);

[[nodiscard]] proto::nostr::Filter MakeFilter(
    std::initializer_list<uint32_t> kinds,
    std::initializer_list<std::string_view> authors = {});

/// Empty filter fields match everything.
[[nodiscard]] bool Matches(const proto::nostr::Filter& filter, const proto::nostr::Event& event);

}
