#pragma once
#include <string>

#include "market/market_config.hpp"

// Loads KEY=VALUE lines from `filepath` (falling back to backend/<filepath>) into the
// process environment. Existing variables are never overwritten.
// Returns false if no file was found.
bool load_env_file(const std::string& filepath = ".env");

// Defaults from MarketSettings, overridden by:
//   AUCTIONHOUSE_MARKETPLACE_FEE_BPS, AUCTIONHOUSE_REFERRER_BPS  (each <= 1500)
//   AUCTIONHOUSE_ENABLED                 (1/0, true/false)
//   AUCTIONHOUSE_ADMINS                  (comma separated)
//   AUCTIONHOUSE_CUSTODY_ADDRESS
//   AUCTIONHOUSE_SELLER_REGISTRY
//   AUCTIONHOUSE_OFFERS_ONLY_RESCIND_DELAY (seconds)
// Throws std::runtime_error on a malformed or out-of-range value.
MarketSettings market_settings_from_env();

// AUCTIONHOUSE_DB_URL, or built from AUCTIONHOUSE_DB_HOST + AUCTIONHOUSE_DB_PASSWORD
// (+ optional AUCTIONHOUSE_DB_PORT). Throws std::runtime_error if neither is set.
std::string journal_connection_string();
