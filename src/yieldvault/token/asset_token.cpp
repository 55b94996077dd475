#include "yieldvault/token/asset_token.hpp"

#include <limits>
#include <utility>

#include "lcr/log/logger.hpp"


namespace yieldvault::token {

AssetToken::AssetToken(Address address, std::string symbol, std::uint8_t decimals)
    : address_(std::move(address))
    , symbol_(std::move(symbol))
    , decimals_(decimals)
{}

Amount AssetToken::balance_of(const Address& holder) const noexcept {
    auto it = balances_.find(holder);
    return (it == balances_.end()) ? 0 : it->second;
}

Amount AssetToken::allowance(const Address& owner, const Address& spender) const noexcept {
    auto it = allowances_.find(owner);
    if (it == allowances_.end()) {
        return 0;
    }
    auto jt = it->second.find(spender);
    return (jt == it->second.end()) ? 0 : jt->second;
}

Error AssetToken::transfer(const Address& from, const Address& to, Amount amount) {
    if (to.empty()) {
        return Error::InvalidReceiver;
    }
    if (amount == 0) {
        return Error::None;
    }
    Amount& src = balances_[from];
    if (src < amount) {
        YV_TRACE("[TOKEN " << symbol_ << "] transfer " << from << " -> " << to
                 << " of " << amount << " exceeds balance " << src);
        return Error::InsufficientBalance;
    }
    src -= amount;
    balances_[to] += amount;
    return Error::None;
}

void AssetToken::approve(const Address& owner, const Address& spender, Amount amount) {
    allowances_[owner][spender] = amount;
}

Error AssetToken::transfer_from(const Address& spender, const Address& from, const Address& to, Amount amount) {
    const Amount allowed = allowance(from, spender);
    if (allowed < amount) {
        YV_TRACE("[TOKEN " << symbol_ << "] allowance " << from << " -> " << spender
                 << " is " << allowed << ", needed " << amount);
        return Error::InsufficientAllowance;
    }
    Error e = transfer(from, to, amount);
    if (e != Error::None) {
        return e;
    }
    if (allowed != std::numeric_limits<Amount>::max()) {
        allowances_[from][spender] = allowed - amount;
    }
    return Error::None;
}

Error AssetToken::mint(const Address& to, Amount amount) {
    if (to.empty()) {
        return Error::InvalidReceiver;
    }
    balances_[to] += amount;
    total_supply_ += amount;
    return Error::None;
}

Error AssetToken::burn(const Address& from, Amount amount) {
    Amount& bal = balances_[from];
    if (bal < amount) {
        return Error::InsufficientBalance;
    }
    bal -= amount;
    total_supply_ -= amount;
    return Error::None;
}

} // namespace yieldvault::token
