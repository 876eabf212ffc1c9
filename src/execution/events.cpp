#include <tranche/execution/events.hpp>

#include <utility>

namespace tranche::execution {

event_builder::event_builder(std::string_view type) {
  event_.type = std::string{type};
}

event_builder& event_builder::text(std::string_view key,
                                   std::string value,
                                   bool index) {
  event_.attributes.push_back(tranche::schema::transaction_event_attribute_t{
      .key = std::string{key}, .value = std::move(value), .index = index});
  return *this;
}

event_builder& event_builder::amount(std::string_view key,
                                     const tranche::schema::amount_t& value) {
  return text(key, tranche::schema::to_string(value));
}

event_builder& event_builder::account(
    std::string_view key,
    const tranche::schema::account_id_t& value) {
  return text(key, tranche::schema::to_hex(value), true);
}

event_builder& event_builder::number(std::string_view key,
                                     uint64_t value,
                                     bool index) {
  return text(key, std::to_string(value), index);
}

event_builder& event_builder::flag(std::string_view key, bool value) {
  return text(key, value ? "true" : "false");
}

tranche::schema::transaction_event_t event_builder::build() {
  return std::move(event_);
}

}  // namespace tranche::execution
