#include <warden/schema/encoding/scale/transaction.hpp>

namespace warden::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.chain_id, encoder);
  ::scale::encode(o.nonce, encoder);
  ::scale::encode(o.signer, encoder);
  ::scale::encode(o.payload, encoder);
  ::scale::encode(o.signature, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.chain_id, decoder);
  ::scale::decode(o.nonce, decoder);
  ::scale::decode(o.signer, decoder);
  ::scale::decode(o.payload, decoder);
  ::scale::decode(o.signature, decoder);
}

}  // namespace warden::schema
