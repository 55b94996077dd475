#pragma once

/*
===============================================================================
yieldvault - Public API Entry Point
===============================================================================

Queue-based pooled-fund vault: deposits and withdrawals are admitted at once
and settled later in operator-triggered batches, while idle capital is placed
with allow-listed yield sources.

Include this header to get the engine, its collaborators (asset token, roles,
allow-list, source interfaces, oracle), the event journal, the status report,
the batch runner and the in-memory simulated sources.
===============================================================================
*/

#include <yieldvault/core/types.hpp>
#include <yieldvault/core/error.hpp>
#include <yieldvault/config/constants.hpp>
#include <yieldvault/config/vault_config.hpp>
#include <yieldvault/config/loader.hpp>
#include <yieldvault/token/asset_token.hpp>
#include <yieldvault/access/roles.hpp>
#include <yieldvault/registry/allow_list.hpp>
#include <yieldvault/source/yield_source.hpp>
#include <yieldvault/oracle/price_oracle.hpp>
#include <yieldvault/engine/vault_state.hpp>
#include <yieldvault/engine/settlement_engine.hpp>
#include <yieldvault/events/event.hpp>
#include <yieldvault/events/journal.hpp>
#include <yieldvault/report/status.hpp>
#include <yieldvault/ops/batch_runner.hpp>
#include <yieldvault/sim/reserve_pool.hpp>
#include <yieldvault/sim/share_pool.hpp>
#include <yieldvault/sim/price_feed.hpp>
