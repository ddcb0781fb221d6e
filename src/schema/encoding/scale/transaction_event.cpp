#include <warden/schema/encoding/scale/transaction_event.hpp>

namespace warden::schema {

void encode(const transaction_event_attribute<1>& o,
            ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.key, encoder);
  ::scale::encode(o.value, encoder);
  ::scale::encode(o.index, encoder);
}

void decode(transaction_event_attribute<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.key, decoder);
  ::scale::decode(o.value, decoder);
  ::scale::decode(o.index, decoder);
}

void encode(const transaction_event<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.type, encoder);
  ::scale::encode(o.attributes, encoder);
}

void decode(transaction_event<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.type, decoder);
  ::scale::decode(o.attributes, decoder);
}

void encode(const event_record<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.event_id, encoder);
  ::scale::encode(o.height, encoder);
  ::scale::encode(o.tx_index, encoder);
  encode(o.event, encoder);
}

void decode(event_record<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.event_id, decoder);
  ::scale::decode(o.height, decoder);
  ::scale::decode(o.tx_index, decoder);
  decode(o.event, decoder);
}

}  // namespace warden::schema
