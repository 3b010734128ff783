// =============================================================================
// ledger.cpp - Coin/Token value types and in-memory host ledgers
// =============================================================================

#include "nftmart/ledger.hpp"
#include <cassert>

namespace nftmart {

// =============================================================================
// Coin
// =============================================================================

Coin& Coin::operator=(Coin&& other) noexcept {
    if (this != &other) {
        // Overwriting a live balance would destroy funds
        assert(value_ == 0);
        currency_ = other.currency_;
        value_ = std::exchange(other.value_, 0);
    }
    return *this;
}

int32_t Coin::extract(Amount amount, Coin& out) {
    if (amount > value_) {
        return errors::ARITHMETIC_UNDERFLOW;
    }
    if (!out.empty()) {
        return errors::INVALID_PARAMETER;
    }
    value_ -= amount;
    out = Coin(currency_, amount);
    return errors::OK;
}

int32_t Coin::merge(Coin&& other) {
    if (other.empty()) {
        return errors::OK;
    }
    if (empty()) {
        currency_ = other.currency_;
    } else if (currency_ != other.currency_) {
        return errors::CURRENCY_MISMATCH;
    }
    value_ += std::exchange(other.value_, 0);
    return errors::OK;
}

// =============================================================================
// Token
// =============================================================================

Token& Token::operator=(Token&& other) noexcept {
    if (this != &other) {
        assert(amount_ == 0);
        id_ = std::move(other.id_);
        amount_ = std::exchange(other.amount_, 0);
    }
    return *this;
}

// =============================================================================
// MemoryCoinStore
// =============================================================================

int32_t MemoryCoinStore::withdraw(const Address& account, const Currency& currency,
                                  Amount amount, Coin& out) {
    if (amount == 0) {
        return errors::INVALID_PARAMETER;
    }

    auto it = balances_.find({account, currency});
    if (it == balances_.end() || it->second < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    Coin withdrawn(currency, amount);
    int32_t rc = out.merge(std::move(withdrawn));
    if (rc != errors::OK) {
        return rc;
    }
    it->second -= amount;
    return errors::OK;
}

void MemoryCoinStore::deposit(const Address& account, Coin&& coin) {
    if (coin.empty()) return;
    const Currency currency = coin.currency();
    balances_[{account, currency}] += coin.release();
}

Amount MemoryCoinStore::balance(const Address& account, const Currency& currency) const {
    auto it = balances_.find({account, currency});
    return (it != balances_.end()) ? it->second : 0;
}

void MemoryCoinStore::mint(const Address& account, const Currency& currency, Amount amount) {
    balances_[{account, currency}] += amount;
}

Amount MemoryCoinStore::total_supply(const Currency& currency) const {
    Amount total = 0;
    for (const auto& [key, amount] : balances_) {
        if (key.second == currency) total += amount;
    }
    return total;
}

// =============================================================================
// MemoryTokenStore
// =============================================================================

int32_t MemoryTokenStore::withdraw(const Address& owner, const TokenId& id,
                                   Amount amount, Token& out) {
    if (amount == 0) {
        return errors::INVALID_PARAMETER;
    }
    if (out.amount() != 0) {
        return errors::INVALID_PARAMETER;
    }

    auto it = balances_.find({owner, id});
    if (it == balances_.end() || it->second < amount) {
        return errors::TOKEN_NOT_FOUND;
    }

    it->second -= amount;
    if (it->second == 0) {
        balances_.erase(it);
    }
    out = Token(id, amount);
    return errors::OK;
}

void MemoryTokenStore::deposit(const Address& account, Token&& token) {
    if (token.amount() == 0) return;
    const TokenId id = token.id();
    balances_[{account, id}] += token.release();
}

int32_t MemoryTokenStore::transfer(const Address& signer, const TokenId& id,
                                   const Address& recipient, Amount amount) {
    Token moved;
    int32_t rc = withdraw(signer, id, amount, moved);
    if (rc != errors::OK) {
        return rc;
    }
    deposit(recipient, std::move(moved));
    return errors::OK;
}

Amount MemoryTokenStore::balance(const Address& owner, const TokenId& id) const {
    auto it = balances_.find({owner, id});
    return (it != balances_.end()) ? it->second : 0;
}

void MemoryTokenStore::mint(const Address& account, const TokenId& id, Amount amount) {
    balances_[{account, id}] += amount;
}

Amount MemoryTokenStore::holdings(const Address& owner) const {
    Amount total = 0;
    for (const auto& [key, amount] : balances_) {
        if (key.first == owner) total += amount;
    }
    return total;
}

} // namespace nftmart
