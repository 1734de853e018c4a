#include <bailment/blake3/hash.hpp>
#include <bailment/codec/transaction_codec.hpp>
#include <bailment/schema/encoding/scale/encoder.hpp>

namespace bailment::codec {

namespace {

using encoder_t = bailment::schema::encoding::scale_encoder_t;

}  // namespace

bailment::schema::bytes_t encode_transaction(
    const bailment::schema::transaction_t& tx) {
  auto encoder = encoder_t{};
  return encoder.encode(tx);
}

std::optional<bailment::schema::transaction_t> decode_transaction(
    const bailment::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode_exact<bailment::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "transaction does not decode exactly";
  }
  return tx;
}

bailment::schema::bytes_t signing_payload(
    const bailment::schema::transaction_t& tx) {
  auto unsigned_tx = tx;
  unsigned_tx.signatures.clear();
  return encode_transaction(unsigned_tx);
}

bailment::schema::hash32_t transaction_id(
    const bailment::schema::transaction_t& tx) {
  auto payload = signing_payload(tx);
  return bailment::blake3::hash({bailment::schema::make_bytes_view(payload)});
}

void sign_transaction(
    bailment::schema::transaction_t& tx,
    const std::vector<std::reference_wrapper<const bailment::crypto::keypair>>&
        signers) {
  auto payload = signing_payload(tx);
  tx.signatures.clear();
  for (const auto& signer : signers) {
    tx.signatures.push_back(bailment::schema::signature_entry_t{
        .signer = signer.get().public_key(),
        .signature = signer.get().sign(payload)});
  }
}

}  // namespace bailment::codec
