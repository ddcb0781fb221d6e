#pragma once
#include <warden/schema/event_record.hpp>
#include <warden/schema/transaction_event.hpp>
#include <warden/schema/transaction_event_attribute.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace warden::schema {

void encode(const transaction_event_attribute<1>& o, ::scale::Encoder& encoder);
void decode(transaction_event_attribute<1>& o, ::scale::Decoder& decoder);

void encode(const transaction_event<1>& o, ::scale::Encoder& encoder);
void decode(transaction_event<1>& o, ::scale::Decoder& decoder);

void encode(const event_record<1>& o, ::scale::Encoder& encoder);
void decode(event_record<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
