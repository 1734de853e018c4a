#include <bailment/address/derive.hpp>
#include <bailment/codec/little_endian.hpp>
#include <bailment/codec/token_instructions.hpp>
#include <bailment/schema/program_ids.hpp>

using namespace bailment::schema;

namespace bailment::codec {

namespace {

bytes_t make_data(const token_instruction_tag tag) {
  return bytes_t{static_cast<uint8_t>(tag)};
}

void append_optional_key(bytes_t& out, const std::optional<pubkey_t>& key) {
  append_le(out, static_cast<uint8_t>(key.has_value() ? 1 : 0));
  append_key(out, key.value_or(make_zero_pubkey()));
}

// One flag byte followed by a 32-byte key that is zero when the flag is
// clear.
std::optional<std::optional<pubkey_t>> read_optional_key(le_reader& reader) {
  auto flag = reader.read<uint8_t>();
  auto key = reader.read_key();
  if (!flag || !key || *flag > 1) {
    return std::nullopt;
  }
  if (*flag == 0) {
    return std::optional<pubkey_t>{};
  }
  return std::optional<pubkey_t>{*key};
}

}  // namespace

instruction_t make_initialize_mint(
    const pubkey_t& mint,
    const uint8_t decimals,
    const pubkey_t& mint_authority,
    const std::optional<pubkey_t>& freeze_authority) {
  auto data = make_data(token_instruction_tag::initialize_mint);
  append_le(data, decimals);
  append_key(data, mint_authority);
  append_optional_key(data, freeze_authority);
  return instruction_t{.program_id = program_ids::token_program(),
                       .accounts = {make_signer_meta(mint)},
                       .data = std::move(data)};
}

instruction_t make_mint_to(const pubkey_t& mint,
                           const pubkey_t& destination,
                           const pubkey_t& authority,
                           const amount_t amount) {
  auto data = make_data(token_instruction_tag::mint_to);
  append_le(data, amount);
  return instruction_t{
      .program_id = program_ids::token_program(),
      .accounts = {make_writable_meta(mint), make_writable_meta(destination),
                   account_meta_t{.key = authority,
                                  .is_signer = true,
                                  .is_writable = false}},
      .data = std::move(data)};
}

instruction_t make_transfer(const pubkey_t& source,
                            const pubkey_t& destination,
                            const pubkey_t& authority,
                            const amount_t amount) {
  auto data = make_data(token_instruction_tag::transfer);
  append_le(data, amount);
  return instruction_t{
      .program_id = program_ids::token_program(),
      .accounts = {make_writable_meta(source), make_writable_meta(destination),
                   account_meta_t{.key = authority,
                                  .is_signer = true,
                                  .is_writable = false}},
      .data = std::move(data)};
}

instruction_t make_set_authority(const pubkey_t& mint,
                                 const pubkey_t& current_authority,
                                 const authority_kind_t kind,
                                 const std::optional<pubkey_t>& new_authority) {
  auto data = make_data(token_instruction_tag::set_authority);
  append_le(data, static_cast<uint8_t>(kind));
  append_optional_key(data, new_authority);
  return instruction_t{
      .program_id = program_ids::token_program(),
      .accounts = {make_writable_meta(mint),
                   account_meta_t{.key = current_authority,
                                  .is_signer = true,
                                  .is_writable = false}},
      .data = std::move(data)};
}

std::optional<token_instruction_t> decode_token_instruction(
    const bytes_view_t& data) {
  auto reader = le_reader{data};
  auto tag = reader.read<uint8_t>();
  if (!tag) {
    return std::nullopt;
  }

  auto decoded = std::optional<token_instruction_t>{};
  switch (static_cast<token_instruction_tag>(*tag)) {
    case token_instruction_tag::transfer:
      if (auto amount = reader.read<uint64_t>()) {
        decoded = transfer_args{.amount = *amount};
      }
      break;
    case token_instruction_tag::mint_to:
      if (auto amount = reader.read<uint64_t>()) {
        decoded = mint_to_args{.amount = *amount};
      }
      break;
    case token_instruction_tag::set_authority: {
      auto kind = reader.read<uint8_t>();
      auto new_authority = read_optional_key(reader);
      if (kind && new_authority && *kind <= 1) {
        decoded = set_authority_args{
            .kind = static_cast<authority_kind_t>(*kind),
            .new_authority = *new_authority};
      }
      break;
    }
    case token_instruction_tag::initialize_mint: {
      auto decimals = reader.read<uint8_t>();
      auto mint_authority = reader.read_key();
      auto freeze_authority = read_optional_key(reader);
      if (decimals && mint_authority && freeze_authority) {
        decoded = initialize_mint_args{.decimals = *decimals,
                                       .mint_authority = *mint_authority,
                                       .freeze_authority = *freeze_authority};
      }
      break;
    }
    default:
      break;
  }

  if (!reader.finished()) {
    return std::nullopt;
  }
  return decoded;
}

instruction_t make_create_holding_account(const pubkey_t& payer,
                                          const pubkey_t& owner,
                                          const pubkey_t& mint,
                                          const bool idempotent) {
  auto holding = bailment::address::derive_holding_account(owner, mint);
  auto tag = idempotent ? holding_instruction_tag::create_idempotent
                        : holding_instruction_tag::create;
  return instruction_t{
      .program_id = program_ids::holding_account_program(),
      .accounts = {make_signer_meta(payer), make_writable_meta(holding.address),
                   make_readonly_meta(owner), make_readonly_meta(mint),
                   make_readonly_meta(program_ids::system_program()),
                   make_readonly_meta(program_ids::token_program())},
      .data = bytes_t{static_cast<uint8_t>(tag)}};
}

std::optional<holding_instruction_tag> decode_holding_instruction(
    const bytes_view_t& data) {
  if (data.empty()) {
    return holding_instruction_tag::create;
  }
  if (data.size() != 1 || data[0] > 1) {
    return std::nullopt;
  }
  return static_cast<holding_instruction_tag>(data[0]);
}

}  // namespace bailment::codec
