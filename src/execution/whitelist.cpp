#include <warden/common/critical.hpp>
#include <warden/execution/whitelist.hpp>

#include <algorithm>

namespace warden::execution {

namespace {

std::array<warden::schema::identity_t, kVenueWhitelistSize>
decode_whitelist() {
  auto venues = std::array<warden::schema::identity_t, kVenueWhitelistSize>{};
  for (std::size_t i = 0; i < kVenueWhitelistSize; ++i) {
    auto venue = warden::schema::try_parse_identity(kVenueWhitelistText[i]);
    if (!venue) {
      warden::common::critical("venue whitelist entry '{}' is not an identity",
                               kVenueWhitelistText[i]);
    }
    venues[i] = *venue;
  }
  return venues;
}

}  // namespace

const std::array<warden::schema::identity_t, kVenueWhitelistSize>&
venue_whitelist() {
  static const auto venues = decode_whitelist();
  return venues;
}

bool is_whitelisted_venue(const warden::schema::identity_t& venue) {
  const auto& venues = venue_whitelist();
  return std::find(std::begin(venues), std::end(venues), venue) !=
         std::end(venues);
}

}  // namespace warden::execution
