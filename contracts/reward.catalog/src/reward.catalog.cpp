#include <reward.catalog/reward.catalog.hpp>

namespace rewardfi {

void reward_catalog::init(const name& admin) {
   require_auth( _self );
   check( is_account(admin), "admin account does not exist" );

   _gstate.admin = admin;
}

void reward_catalog::setconfig(const uint8_t& service_type, const uint8_t& level, const asset& price,
                               const uint32_t& duration_seconds, const bool& is_active, const string& description) {
   require_auth( _gstate.admin );

   check( service_type < SERVICE_TYPE_COUNT, "invalid service type" );
   check( level < SERVICE_LEVEL_COUNT, "invalid service level" );
   check( price.is_valid(), "invalid price" );
   check( price.amount > 0, "price must be positive" );
   check( duration_seconds > 0, "duration must be positive" );
   check( description.size() <= 256, "description has more than 256 bytes" );

   service_config_t::tbl_t confs(_self, service_type);
   auto itr = confs.find(level);
   if (itr == confs.end()) {
      confs.emplace(_self, [&](auto& c) {
         c.level              = level;
         c.price              = price;
         c.duration_seconds   = duration_seconds;
         c.is_active          = is_active;
         c.description        = description;
      });
   } else {
      confs.modify(itr, same_payer, [&](auto& c) {
         c.price              = price;
         c.duration_seconds   = duration_seconds;
         c.is_active          = is_active;
         c.description        = description;
      });
   }
}

void reward_catalog::setcooldown(const uint8_t& service_type, const uint32_t& cooldown_seconds) {
   require_auth( _gstate.admin );
   check( service_type < SERVICE_TYPE_COUNT, "invalid service type" );

   service_meta_t::tbl_t metas(_self, _self.value);
   auto itr = metas.find(service_type);
   if (itr == metas.end()) {
      metas.emplace(_self, [&](auto& m) {
         m.service_type       = service_type;
         m.cooldown_seconds   = cooldown_seconds;
      });
   } else {
      metas.modify(itr, same_payer, [&](auto& m) {
         m.cooldown_seconds   = cooldown_seconds;
      });
   }
}

} //namespace rewardfi
