#pragma once
#include <warden/schema/deduct_compute_fee.hpp>
#include <warden/schema/deposit.hpp>
#include <warden/schema/execute_swap.hpp>
#include <warden/schema/expire_session.hpp>
#include <warden/schema/initialize_session.hpp>
#include <warden/schema/pause_session.hpp>
#include <warden/schema/resume_session.hpp>
#include <warden/schema/withdraw.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// SCALE codecs of the escrow operation payloads. Declared in the schema
// namespace so the codec finds them by argument dependent lookup when it
// walks the payload variant.
namespace warden::schema {

void encode(const initialize_session<1>& o, ::scale::Encoder& encoder);
void decode(initialize_session<1>& o, ::scale::Decoder& decoder);

void encode(const deposit<1>& o, ::scale::Encoder& encoder);
void decode(deposit<1>& o, ::scale::Decoder& decoder);

void encode(const execute_swap<1>& o, ::scale::Encoder& encoder);
void decode(execute_swap<1>& o, ::scale::Decoder& decoder);

void encode(const deduct_compute_fee<1>& o, ::scale::Encoder& encoder);
void decode(deduct_compute_fee<1>& o, ::scale::Decoder& decoder);

void encode(const pause_session<1>& o, ::scale::Encoder& encoder);
void decode(pause_session<1>& o, ::scale::Decoder& decoder);

void encode(const resume_session<1>& o, ::scale::Encoder& encoder);
void decode(resume_session<1>& o, ::scale::Decoder& decoder);

void encode(const withdraw<1>& o, ::scale::Encoder& encoder);
void decode(withdraw<1>& o, ::scale::Decoder& decoder);

void encode(const expire_session<1>& o, ::scale::Encoder& encoder);
void decode(expire_session<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
