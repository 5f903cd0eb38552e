#include "contextvm/protocol/event_filter.hpp"
#include "contextvm/protocol/event_builder.hpp"
#include "contextvm/core/constants.hpp"
#include <algorithm>

namespace contextvm::protocol {
    proto::nostr::Filter MakeInboundFilter(const std::string_view pubkey) {
        proto::nostr::Filter filter;
        filter.add_kinds(EventKinds::CTXVM_MESSAGES);
        filter.add_kinds(EventKinds::GIFT_WRAP);
        filter.add_recipients(std::string(pubkey));
        return filter;
    }

    proto::nostr::Filter MakeFilter(
        const std::initializer_list<uint32_t> kinds,
        const std::initializer_list<std::string_view> authors) {
        proto::nostr::Filter filter;
        for (const auto kind: kinds) {
            filter.add_kinds(kind);
        }
        for (const auto author: authors) {
            filter.add_authors(std::string(author));
        }
        return filter;
    }

    bool Matches(const proto::nostr::Filter &filter, const proto::nostr::Event &event) {
        if (filter.kinds_size() > 0 &&
            std::find(filter.kinds().begin(), filter.kinds().end(), event.kind()) == filter.kinds().end()) {
            return false;
        }
        if (filter.authors_size() > 0 &&
            std::find(filter.authors().begin(), filter.authors().end(), event.pubkey()) == filter.authors().end()) {
            return false;
        }
        if (filter.recipients_size() > 0) {
            const auto recipients = EventBuilder::FindAllTagValues(event, TagNames::PUBKEY);
            return std::any_of(recipients.begin(), recipients.end(), [&filter](const std::string &value) {
                return std::find(filter.recipients().begin(), filter.recipients().end(), value) !=
                       filter.recipients().end();
            });
        }
        return true;
    }
}
