#include <bailment/codec/token_instructions.hpp>
#include <bailment/execution/token_program.hpp>
#include <bailment/schema/encoding/scale/encoder.hpp>
#include <bailment/schema/program_ids.hpp>

#include <spdlog/fmt/fmt.h>

#include <limits>

using namespace bailment::schema;
using namespace bailment::codec;

namespace bailment::execution::token_program {

namespace {

using encoder_t = bailment::schema::encoding::scale_encoder_t;

template <typename Record>
std::optional<Record> decode_exact(const account_t& account) {
  if (account.owner != program_ids::token_program()) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  return encoder.try_decode_exact<Record>(make_bytes_view(account.data));
}

struct loaded_holding final {
  pubkey_t key{};
  holding_account_state_t state;
};

std::optional<loaded_holding> load_holding(const instruction_context& context,
                                           const pubkey_t& key,
                                           transaction_error_code& error) {
  auto account = context.load(key);
  if (!account) {
    error = transaction_error_code::account_not_initialized;
    return std::nullopt;
  }
  auto state = decode_holding(*account);
  if (!state || state->state == holding_account_status_t::uninitialized) {
    error = transaction_error_code::account_owned_by_wrong_program;
    return std::nullopt;
  }
  return loaded_holding{.key = key, .state = *state};
}

std::optional<mint_state_t> load_mint(const instruction_context& context,
                                      const pubkey_t& key,
                                      transaction_error_code& error) {
  auto account = context.load(key);
  if (!account) {
    error = transaction_error_code::account_not_initialized;
    return std::nullopt;
  }
  auto state = decode_mint(*account);
  if (!state || !state->is_initialized) {
    error = transaction_error_code::invalid_mint;
    return std::nullopt;
  }
  return state;
}

transaction_error_code initialize_mint(instruction_context& context,
                                       const initialize_mint_args& args) {
  const auto& accounts = context.instruction().accounts;
  if (accounts.empty()) {
    return transaction_error_code::not_enough_account_keys;
  }
  const auto& mint = accounts[0].key;
  if (!context.is_signer(mint)) {
    return transaction_error_code::account_not_signer;
  }
  if (args.decimals > kMaxDecimals) {
    return transaction_error_code::invalid_mint;
  }
  auto state = mint_state_t{.mint_authority = args.mint_authority,
                            .supply = 0,
                            .decimals = args.decimals,
                            .is_initialized = true,
                            .freeze_authority = args.freeze_authority};
  auto code = context.create_account(mint, program_ids::token_program(),
                                     encode_mint(state));
  if (code == transaction_error_code::ok) {
    context.log(fmt::format("Instruction: InitializeMint decimals={}",
                            args.decimals));
  }
  return code;
}

transaction_error_code mint_to(instruction_context& context,
                               const mint_to_args& args) {
  const auto& accounts = context.instruction().accounts;
  if (accounts.size() < 3) {
    return transaction_error_code::not_enough_account_keys;
  }
  const auto& mint_key = accounts[0].key;
  const auto& authority = accounts[2].key;

  auto error = transaction_error_code::ok;
  auto mint = load_mint(context, mint_key, error);
  if (!mint) {
    return error;
  }
  auto destination = load_holding(context, accounts[1].key, error);
  if (!destination) {
    return error;
  }
  if (destination->state.mint != mint_key) {
    return transaction_error_code::mint_mismatch;
  }
  if (destination->state.state == holding_account_status_t::frozen) {
    return transaction_error_code::account_frozen;
  }
  if (!mint->mint_authority) {
    return transaction_error_code::fixed_supply;
  }
  if (*mint->mint_authority != authority) {
    return transaction_error_code::owner_mismatch;
  }
  if (!context.is_signer(authority)) {
    return transaction_error_code::account_not_signer;
  }
  constexpr auto kMax = std::numeric_limits<amount_t>::max();
  if (mint->supply > kMax - args.amount ||
      destination->state.amount > kMax - args.amount) {
    return transaction_error_code::arithmetic_overflow;
  }

  mint->supply += args.amount;
  destination->state.amount += args.amount;
  if (auto code = context.store(mint_key, encode_mint(*mint));
      code != transaction_error_code::ok) {
    return code;
  }
  if (auto code = context.store(destination->key,
                                encode_holding(destination->state));
      code != transaction_error_code::ok) {
    return code;
  }
  context.log(fmt::format("Instruction: MintTo amount={}", args.amount));
  return transaction_error_code::ok;
}

transaction_error_code transfer(instruction_context& context,
                                const transfer_args& args) {
  const auto& accounts = context.instruction().accounts;
  if (accounts.size() < 3) {
    return transaction_error_code::not_enough_account_keys;
  }
  const auto& authority = accounts[2].key;

  auto error = transaction_error_code::ok;
  auto source = load_holding(context, accounts[0].key, error);
  if (!source) {
    return error;
  }
  auto destination = load_holding(context, accounts[1].key, error);
  if (!destination) {
    return error;
  }
  if (source->state.mint != destination->state.mint) {
    return transaction_error_code::mint_mismatch;
  }
  if (source->state.state == holding_account_status_t::frozen ||
      destination->state.state == holding_account_status_t::frozen) {
    return transaction_error_code::account_frozen;
  }
  if (source->state.owner != authority) {
    return transaction_error_code::owner_mismatch;
  }
  if (!context.is_signer(authority)) {
    return transaction_error_code::account_not_signer;
  }
  if (source->state.amount < args.amount) {
    return transaction_error_code::insufficient_funds;
  }

  if (source->key != destination->key) {
    if (destination->state.amount >
        std::numeric_limits<amount_t>::max() - args.amount) {
      return transaction_error_code::arithmetic_overflow;
    }
    source->state.amount -= args.amount;
    destination->state.amount += args.amount;
    if (auto code = context.store(source->key, encode_holding(source->state));
        code != transaction_error_code::ok) {
      return code;
    }
    if (auto code = context.store(destination->key,
                                  encode_holding(destination->state));
        code != transaction_error_code::ok) {
      return code;
    }
  }
  context.log(fmt::format("Instruction: Transfer amount={}", args.amount));
  return transaction_error_code::ok;
}

transaction_error_code set_authority(instruction_context& context,
                                     const set_authority_args& args) {
  const auto& accounts = context.instruction().accounts;
  if (accounts.size() < 2) {
    return transaction_error_code::not_enough_account_keys;
  }
  const auto& mint_key = accounts[0].key;
  const auto& current = accounts[1].key;

  auto error = transaction_error_code::ok;
  auto mint = load_mint(context, mint_key, error);
  if (!mint) {
    return error;
  }
  auto& slot = args.kind == authority_kind_t::mint_tokens
                   ? mint->mint_authority
                   : mint->freeze_authority;
  if (!slot) {
    return args.kind == authority_kind_t::mint_tokens
               ? transaction_error_code::fixed_supply
               : transaction_error_code::owner_mismatch;
  }
  if (*slot != current) {
    return transaction_error_code::owner_mismatch;
  }
  if (!context.is_signer(current)) {
    return transaction_error_code::account_not_signer;
  }
  slot = args.new_authority;
  if (auto code = context.store(mint_key, encode_mint(*mint));
      code != transaction_error_code::ok) {
    return code;
  }
  context.log("Instruction: SetAuthority");
  return transaction_error_code::ok;
}

}  // namespace

transaction_error_code process(instruction_context& context) {
  auto decoded = decode_token_instruction(context.instruction().data);
  if (!decoded) {
    return transaction_error_code::instruction_did_not_deserialize;
  }
  return std::visit(
      overloaded{[&](const initialize_mint_args& args) {
                   return initialize_mint(context, args);
                 },
                 [&](const mint_to_args& args) { return mint_to(context, args); },
                 [&](const transfer_args& args) {
                   return transfer(context, args);
                 },
                 [&](const set_authority_args& args) {
                   return set_authority(context, args);
                 }},
      *decoded);
}

std::optional<mint_state_t> decode_mint(const account_t& account) {
  return decode_exact<mint_state_t>(account);
}

std::optional<holding_account_state_t> decode_holding(
    const account_t& account) {
  return decode_exact<holding_account_state_t>(account);
}

bytes_t encode_mint(const mint_state_t& mint) {
  auto encoder = encoder_t{};
  return encoder.encode(mint);
}

bytes_t encode_holding(const holding_account_state_t& holding) {
  auto encoder = encoder_t{};
  return encoder.encode(holding);
}

}  // namespace bailment::execution::token_program
