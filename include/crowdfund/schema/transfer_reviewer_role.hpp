#pragma once
#include <crowdfund/schema/primitives.hpp>

// Schema type: transfer reviewer role.
namespace crowdfund::schema {

template <uint16_t Version>
struct transfer_reviewer_role;

template <>
struct transfer_reviewer_role<1> final {
  uint16_t version{1};
  account_id_t new_reviewer{};
};

using transfer_reviewer_role_t = transfer_reviewer_role<1>;

}  // namespace crowdfund::schema
