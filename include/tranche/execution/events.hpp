#pragma once

#include <tranche/schema/primitives.hpp>
#include <tranche/schema/transaction_event.hpp>
#include <string>
#include <string_view>

namespace tranche::execution {

inline constexpr std::string_view kConvertEvent{"convert"};
inline constexpr std::string_view kRedeemEvent{"redeem"};
inline constexpr std::string_view kInitiateDisputeEvent{"initiate_dispute"};
inline constexpr std::string_view kVoteEvent{"vote"};
inline constexpr std::string_view kResolveDisputeEvent{"resolve_dispute"};
inline constexpr std::string_view kWithdrawOwedFeesEvent{"withdraw_owed_fees"};
inline constexpr std::string_view kWithdrawGovernanceRewardEvent{
    "withdraw_governance_reward"};
inline constexpr std::string_view kWithdrawBaseRewardEvent{
    "withdraw_base_reward"};
inline constexpr std::string_view kTransferEvent{"transfer"};
inline constexpr std::string_view kApproveEvent{"approve"};

/// Accumulates attributes for one domain event.
class event_builder final {
 public:
  explicit event_builder(std::string_view type);

  event_builder& text(std::string_view key,
                      std::string value,
                      bool index = false);
  event_builder& amount(std::string_view key,
                        const tranche::schema::amount_t& value);
  /// Accounts are hex encoded and always indexed.
  event_builder& account(std::string_view key,
                         const tranche::schema::account_id_t& value);
  event_builder& number(std::string_view key,
                        uint64_t value,
                        bool index = false);
  event_builder& flag(std::string_view key, bool value);

  tranche::schema::transaction_event_t build();

 private:
  tranche::schema::transaction_event_t event_;
};

}  // namespace tranche::execution
