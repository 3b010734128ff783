#ifndef NFTMART_LEDGER_HPP
#define NFTMART_LEDGER_HPP

#include <map>
#include <utility>

#include "types.hpp"

namespace nftmart {

// =============================================================================
// Coin - move-only fungible balance
// =============================================================================

class Coin {
public:
    Coin() = default;
    Coin(const Currency& currency, Amount value) : currency_(currency), value_(value) {}

    Coin(Coin&& other) noexcept
        : currency_(other.currency_), value_(std::exchange(other.value_, 0)) {}
    Coin& operator=(Coin&& other) noexcept;

    // Non-copyable
    Coin(const Coin&) = delete;
    Coin& operator=(const Coin&) = delete;

    const Currency& currency() const { return currency_; }
    Amount value() const { return value_; }
    bool empty() const { return value_ == 0; }

    // Split `amount` off into `out`; out must be empty
    int32_t extract(Amount amount, Coin& out);

    // Absorb `other` (same currency)
    int32_t merge(Coin&& other);

    // Hand the whole balance to a ledger; the coin is left empty
    Amount release() noexcept { return std::exchange(value_, 0); }

private:
    Currency currency_;
    Amount value_ = 0;
};

// =============================================================================
// Token - move-only non-fungible item held in custody
// =============================================================================

class Token {
public:
    Token() = default;
    Token(TokenId id, Amount amount) : id_(std::move(id)), amount_(amount) {}

    Token(Token&& other) noexcept
        : id_(std::move(other.id_)), amount_(std::exchange(other.amount_, 0)) {}
    Token& operator=(Token&& other) noexcept;

    // Non-copyable
    Token(const Token&) = delete;
    Token& operator=(const Token&) = delete;

    const TokenId& id() const { return id_; }
    Amount amount() const { return amount_; }

    // Hand the item to a custody ledger
    Amount release() noexcept { return std::exchange(amount_, 0); }

private:
    TokenId id_;
    Amount amount_ = 0;
};

// =============================================================================
// Host Ledger Interfaces
// =============================================================================

// Fungible-value ledger
class ICoinStore {
public:
    virtual ~ICoinStore() = default;

    // Withdraw `amount` of `currency` from account into `out`
    virtual int32_t withdraw(const Address& account, const Currency& currency,
                             Amount amount, Coin& out) = 0;

    // Credit the whole coin to account
    virtual void deposit(const Address& account, Coin&& coin) = 0;

    virtual Amount balance(const Address& account, const Currency& currency) const = 0;
};

// Asset-custody ledger
class ITokenStore {
public:
    virtual ~ITokenStore() = default;

    virtual int32_t withdraw(const Address& owner, const TokenId& id,
                             Amount amount, Token& out) = 0;
    virtual void deposit(const Address& account, Token&& token) = 0;
    virtual int32_t transfer(const Address& signer, const TokenId& id,
                             const Address& recipient, Amount amount) = 0;

    virtual Amount balance(const Address& owner, const TokenId& id) const = 0;
};

// =============================================================================
// In-memory ledgers (host side: tests, demo, embedding)
// =============================================================================

class MemoryCoinStore : public ICoinStore {
public:
    MemoryCoinStore() = default;

    // Non-copyable
    MemoryCoinStore(const MemoryCoinStore&) = delete;
    MemoryCoinStore& operator=(const MemoryCoinStore&) = delete;

    int32_t withdraw(const Address& account, const Currency& currency,
                     Amount amount, Coin& out) override;
    void deposit(const Address& account, Coin&& coin) override;
    Amount balance(const Address& account, const Currency& currency) const override;

    // Bootstrap balances (not reachable from pool operations)
    void mint(const Address& account, const Currency& currency, Amount amount);

    // Sum of all account balances in a currency
    Amount total_supply(const Currency& currency) const;

private:
    std::map<std::pair<Address, Currency>, Amount> balances_;
};

class MemoryTokenStore : public ITokenStore {
public:
    MemoryTokenStore() = default;

    // Non-copyable
    MemoryTokenStore(const MemoryTokenStore&) = delete;
    MemoryTokenStore& operator=(const MemoryTokenStore&) = delete;

    int32_t withdraw(const Address& owner, const TokenId& id,
                     Amount amount, Token& out) override;
    void deposit(const Address& account, Token&& token) override;
    int32_t transfer(const Address& signer, const TokenId& id,
                     const Address& recipient, Amount amount) override;
    Amount balance(const Address& owner, const TokenId& id) const override;

    void mint(const Address& account, const TokenId& id, Amount amount = 1);

    // Total token units held by an account across all ids
    Amount holdings(const Address& owner) const;

private:
    std::map<std::pair<Address, TokenId>, Amount> balances_;
};

} // namespace nftmart

#endif // NFTMART_LEDGER_HPP
