#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <string>

#define MINT(bank, to, quantity, memo) \
    {	rewardfi::reward_points::mint_action act{ bank, { {_self, active_perm} } };\
        act.send( to, quantity, memo );}

#define BURN(bank, from, quantity, memo) \
    {	rewardfi::reward_points::burn_action act{ bank, { {_self, active_perm} } };\
        act.send( from, quantity, memo );}

namespace rewardfi
{

    using std::string;
    using namespace eosio;

    static constexpr eosio::name active_perm    {"active"_n};

    /**
     * The `reward.points` contract is the points balance ledger of the reward system.
     *
     * Points are minted and burnt only by the configured minter account, which is the
     * `reward.core` contract. There is no transfer: balances move only when the core
     * releases locked points or charges a penalty or a service purchase.
     *
     * Balances are kept in the `accounts` table scoped by owner, one row per symbol,
     * so readers can query `get_balance` the same way as a regular token contract.
     */
    class [[eosio::contract( "reward.points" )]] reward_points : public contract
    {
    public:
        using contract::contract;

        reward_points(eosio::name receiver, eosio::name code, datastream<const char*> ds):
            contract(receiver, code, ds), _global(_self, _self.value)
        {
            if (_global.exists()) {
                _g = _global.get();

            } else { // first init
                _g = global_t{};
            }
        }

        ~reward_points() { _global.set( _g, get_self() ); }

        /**
         * Set the minter and the maximum supply.
         *
         * @param minter - the only account allowed to mint and burn, normally `reward.core`
         * @param max_supply - maximum supply, its symbol is the points symbol
         */
        ACTION init(const name& minter, const asset& max_supply);

        /**
         * Mint `quantity` points to account `to`.
         *
         * @param to - the receiving account, must exist
         * @param quantity - positive amount of points
         * @param memo - reason of the mint
         */
        ACTION mint(const name& to, const asset& quantity, const string& memo);

        /**
         * Burn `quantity` points from account `from`, fails with overdrawn balance
         * when the account holds less than `quantity`.
         */
        ACTION burn(const name& from, const asset& quantity, const string& memo);

        static asset get_balance(const name& points_contract, const name& owner, const symbol& sym)
        {
            accounts accountstable(points_contract, owner.value);
            auto itr = accountstable.find(sym.code().raw());
            if (itr == accountstable.end()) return asset(0, sym);
            return itr->balance;
        }

        using mint_action = eosio::action_wrapper<"mint"_n, &reward_points::mint>;
        using burn_action = eosio::action_wrapper<"burn"_n, &reward_points::burn>;

    private:
        struct [[eosio::table("global"), eosio::contract( "reward.points" )]] global_t {
            name  minter;
            asset supply;
            asset max_supply;

            EOSLIB_SERIALIZE( global_t, (minter)(supply)(max_supply) )
        };

        typedef eosio::singleton< "global"_n, global_t > global_singleton;

        global_singleton    _global;
        global_t            _g;

        struct [[eosio::table, eosio::contract( "reward.points" )]] account
        {
            asset balance;

            uint64_t primary_key() const { return balance.symbol.code().raw(); }

            EOSLIB_SERIALIZE( account, (balance) )
        };
        typedef eosio::multi_index<"accounts"_n, account> accounts;

    private:
        void sub_balance(const name& owner, const asset& value);
        void add_balance(const name& owner, const asset& value, const name& ram_payer);
    };

}
