#pragma once

// High-level crowdfund facade
// Composes the campaign ledger core and the host implementations

#include "crowdfund/common/error.hpp"
#include "crowdfund/ledger/ledger.hpp"
#include "crowdfund/storage/memory_host.hpp"
#include "crowdfund/storage/sqlite_host.hpp"
