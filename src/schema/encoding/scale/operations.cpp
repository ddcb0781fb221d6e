#include <warden/schema/encoding/scale/operations.hpp>

namespace warden::schema {

void encode(const initialize_session<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.session_id, encoder);
  ::scale::encode(o.duration_days, encoder);
  ::scale::encode(o.agent, encoder);
  ::scale::encode(o.fee_recipient, encoder);
}

void decode(initialize_session<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.session_id, decoder);
  ::scale::decode(o.duration_days, decoder);
  ::scale::decode(o.agent, decoder);
  ::scale::decode(o.fee_recipient, decoder);
}

void encode(const deposit<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.owner, encoder);
  ::scale::encode(o.session_id, encoder);
  ::scale::encode(o.amount, encoder);
  ::scale::encode(o.fee_recipient, encoder);
}

void decode(deposit<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.owner, decoder);
  ::scale::decode(o.session_id, decoder);
  ::scale::decode(o.amount, decoder);
  ::scale::decode(o.fee_recipient, decoder);
}

void encode(const execute_swap<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.owner, encoder);
  ::scale::encode(o.session_id, encoder);
  ::scale::encode(o.amount_in, encoder);
  ::scale::encode(o.minimum_amount_out, encoder);
  ::scale::encode(o.venue, encoder);
}

void decode(execute_swap<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.owner, decoder);
  ::scale::decode(o.session_id, decoder);
  ::scale::decode(o.amount_in, decoder);
  ::scale::decode(o.minimum_amount_out, decoder);
  ::scale::decode(o.venue, decoder);
}

void encode(const deduct_compute_fee<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.owner, encoder);
  ::scale::encode(o.session_id, encoder);
  ::scale::encode(o.fee_recipient, encoder);
}

void decode(deduct_compute_fee<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.owner, decoder);
  ::scale::decode(o.session_id, decoder);
  ::scale::decode(o.fee_recipient, decoder);
}

// The four owner/session operations share one wire shape.
namespace {

template <typename T>
void encode_session_ref(const T& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.owner, encoder);
  ::scale::encode(o.session_id, encoder);
}

template <typename T>
void decode_session_ref(T& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.owner, decoder);
  ::scale::decode(o.session_id, decoder);
}

}  // namespace

void encode(const pause_session<1>& o, ::scale::Encoder& encoder) {
  encode_session_ref(o, encoder);
}

void decode(pause_session<1>& o, ::scale::Decoder& decoder) {
  decode_session_ref(o, decoder);
}

void encode(const resume_session<1>& o, ::scale::Encoder& encoder) {
  encode_session_ref(o, encoder);
}

void decode(resume_session<1>& o, ::scale::Decoder& decoder) {
  decode_session_ref(o, decoder);
}

void encode(const withdraw<1>& o, ::scale::Encoder& encoder) {
  encode_session_ref(o, encoder);
}

void decode(withdraw<1>& o, ::scale::Decoder& decoder) {
  decode_session_ref(o, decoder);
}

void encode(const expire_session<1>& o, ::scale::Encoder& encoder) {
  encode_session_ref(o, encoder);
}

void decode(expire_session<1>& o, ::scale::Decoder& decoder) {
  decode_session_ref(o, decoder);
}

}  // namespace warden::schema
