#include "yieldvault/report/status.hpp"

#include <iomanip>

#include "yieldvault/config/constants.hpp"
#include "lcr/format.hpp"


namespace yieldvault::report {

Status capture(const engine::SettlementEngine& vault) {
    const config::VaultConfig& cfg = vault.vault_config();
    Status s{
        .name = cfg.name,
        .symbol = cfg.symbol,
        .asset_decimals = cfg.asset_decimals,
        .paused = vault.paused(),
        .fee_bps = vault.fee_bps(),
        .fee_recipient = vault.fee_recipient(),
        .idle_balance = vault.idle_balance(),
        .total_assets = vault.total_assets(),
        .total_supply = vault.total_supply(),
        .share_price = vault.share_price(),
        .pending_deposit_assets = vault.pending_deposit_assets(),
        .total_requested_assets = vault.total_requested_assets(),
        .deposit_queue_length = vault.deposit_queue_length(),
        .redeem_queue_length = vault.redeem_queue_length(),
        .sources = {}
    };
    for (const Address& addr : vault.sources().list_allowed()) {
        const source::Handle* handle = vault.sources().handle_of(addr);
        s.sources.push_back(SourceLine{
            .address = addr,
            .kind = handle ? handle->kind : source::Kind::ReserveStyle,
            .principal = vault.pool_principal(addr),
            .value = vault.state().ledger.source_value(addr)
        });
    }
    return s;
}

std::ostream& operator<<(std::ostream& os, const Status& s) {
    const auto units = [&](Amount a) { return lcr::format_units(a, s.asset_decimals); };
    const double price = static_cast<double>(s.share_price) / static_cast<double>(config::PRICE_SCALE);

    os << "\n=== " << s.name << " (" << s.symbol << ")" << (s.paused ? " [PAUSED]" : "") << " ===\n";
    os << "Valuation\n";
    os << "  Idle balance:       " << units(s.idle_balance) << '\n';
    os << "  Total assets:       " << units(s.total_assets) << '\n';
    os << "  Total supply:       " << units(s.total_supply) << '\n';
    os << "  Share price:        " << std::fixed << std::setprecision(6) << price << '\n';
    os << "  Fee:                " << lcr::format_bps(s.fee_bps)
       << " -> " << (s.fee_recipient.empty() ? "<none>" : s.fee_recipient) << '\n';

    os << "\nQueues\n";
    os << "  Pending deposits:   " << s.deposit_queue_length << " (" << units(s.pending_deposit_assets) << ")\n";
    os << "  Pending redeems:    " << s.redeem_queue_length << " (" << units(s.total_requested_assets) << ")\n";

    os << "\nSources\n";
    if (s.sources.empty()) {
        os << "  (none listed)\n";
    }
    for (const SourceLine& line : s.sources) {
        os << "  " << line.address << " [" << source::to_string(line.kind) << "]"
           << " principal " << units(line.principal)
           << ", value " << units(line.value) << '\n';
    }
    return os;
}

} // namespace yieldvault::report
