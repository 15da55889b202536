#pragma once

#include <crowdfund/schema/primitives.hpp>

namespace crowdfund::execution {

/// Start-up parameters of the engine. `reviewer` and `settlement_asset` seed
/// the registry on first start only; afterwards persisted state wins.
struct engine_config final {
  crowdfund::schema::hash32_t chain_id{};
  crowdfund::schema::account_id_t reviewer{};
  crowdfund::schema::asset_id_t settlement_asset{};
};

}  // namespace crowdfund::execution
