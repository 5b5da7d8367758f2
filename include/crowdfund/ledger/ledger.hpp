#pragma once

#include "address.hpp"
#include "campaign.hpp"
#include "campaign_ledger.hpp"
#include "codec.hpp"
#include "host.hpp"
#include "instruction.hpp"
#include "pubkey.hpp"
#include "rent.hpp"

namespace crowdfund::ledger {
    // Aggregates ledger headers under crowdfund::ledger
}
