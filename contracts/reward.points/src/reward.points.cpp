#include <reward.points/reward.points.hpp>

namespace rewardfi {

void reward_points::init(const name& minter, const asset& max_supply)
{
    require_auth( _self );
    check( is_account(minter), "minter account does not exist" );
    check( max_supply.is_valid(), "invalid max supply" );
    check( max_supply.amount > 0, "max supply must be positive" );
    check( _g.supply.amount == 0, "points already in circulation" );

    _g.minter       = minter;
    _g.max_supply   = max_supply;
    _g.supply       = asset(0, max_supply.symbol);
}

void reward_points::mint(const name& to, const asset& quantity, const string& memo)
{
    require_auth( _g.minter );

    check( is_account(to), "to account does not exist" );
    check( memo.size() <= 256, "memo has more than 256 bytes" );
    check( quantity.is_valid(), "invalid quantity" );
    check( quantity.amount > 0, "must mint positive quantity" );
    check( quantity.symbol == _g.max_supply.symbol, "symbol precision mismatch" );
    check( quantity.amount <= _g.max_supply.amount - _g.supply.amount, "quantity exceeds available supply" );

    _g.supply += quantity;

    add_balance(to, quantity, _g.minter);
}

void reward_points::burn(const name& from, const asset& quantity, const string& memo)
{
    require_auth( _g.minter );

    check( memo.size() <= 256, "memo has more than 256 bytes" );
    check( quantity.is_valid(), "invalid quantity" );
    check( quantity.amount > 0, "must burn positive quantity" );
    check( quantity.symbol == _g.supply.symbol, "symbol mismatch" );
    check( _g.supply >= quantity, "supply over-burnt" );

    _g.supply -= quantity;

    sub_balance(from, quantity);
}

void reward_points::sub_balance(const name& owner, const asset& quant)
{
    accounts from_accts( get_self(), owner.value );
    const auto& from = from_accts.get( quant.symbol.code().raw(), "no balance object found" );
    check( from.balance >= quant, "overdrawn balance" );

    from_accts.modify(from, same_payer, [&](auto& a) {
        a.balance -= quant;
    });
}

void reward_points::add_balance(const name& owner, const asset& quant, const name& ram_payer)
{
    accounts to_accts( get_self(), owner.value );
    auto to = to_accts.find( quant.symbol.code().raw() );
    if (to == to_accts.end()) {
        to_accts.emplace(ram_payer, [&](auto& a) {
            a.balance = quant;
        });
        return;
    }

    to_accts.modify(to, same_payer, [&](auto& a) {
        a.balance += quant;
    });
}

} /// namespace rewardfi
