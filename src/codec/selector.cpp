#include <bailment/codec/selector.hpp>
#include <bailment/crypto/sha256.hpp>
#include <bailment/schema/operation.hpp>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

namespace bailment::codec {

namespace {

selector_t truncated_digest(const std::string_view prefix,
                            const std::string_view name) {
  auto digest =
      bailment::crypto::sha256_hasher{}.update(prefix).update(name).finalize();
  auto out = selector_t{};
  std::copy_n(std::begin(digest), out.size(), std::begin(out));
  return out;
}

using selector_table_t = std::array<std::pair<selector_t, std::string_view>,
                                    std::variant_size_v<schema::operation_t>>;

template <std::size_t... I>
selector_table_t build_selector_table(std::index_sequence<I...>) {
  return selector_table_t{std::pair<selector_t, std::string_view>{
      make_selector(
          std::variant_alternative_t<I, schema::operation_t>::kName),
      std::variant_alternative_t<I, schema::operation_t>::kName}...};
}

const selector_table_t& selector_table() {
  static const auto table = build_selector_table(
      std::make_index_sequence<std::variant_size_v<schema::operation_t>>{});
  return table;
}

}  // namespace

selector_t make_selector(const std::string_view operation_name) {
  return truncated_digest("global:", operation_name);
}

selector_t make_account_discriminator(const std::string_view record_name) {
  return truncated_digest("account:", record_name);
}

std::optional<std::string_view> operation_for_selector(
    const selector_t& selector) {
  const auto& table = selector_table();
  auto found = std::find_if(
      std::begin(table), std::end(table),
      [&](const auto& entry) { return entry.first == selector; });
  if (found == std::end(table)) {
    return std::nullopt;
  }
  return found->second;
}

}  // namespace bailment::codec
