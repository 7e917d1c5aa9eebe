#include "env_config.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "util/market_log.hpp"

namespace
{
    void trim(std::string& s)
    {
        s.erase(0, s.find_first_not_of(" \t\r"));
        s.erase(s.find_last_not_of(" \t\r") + 1);
    }

    const char* env(const char* name)
    {
        const char* v = std::getenv(name);
        if (v == nullptr || *v == '\0')
            return nullptr;
        return v;
    }

    std::uint64_t env_uint(const char* name, std::uint64_t fallback, std::uint64_t max)
    {
        const char* v = env(name);
        if (!v)
            return fallback;
        std::uint64_t parsed = 0;
        try {
            std::size_t used = 0;
            parsed = std::stoull(v, &used);
            if (used != std::string(v).size())
                throw std::invalid_argument("trailing characters");
        } catch (const std::exception&) {
            throw std::runtime_error(std::string(name) + " is not a number: '" + v + "'");
        }
        if (parsed > max)
            throw std::runtime_error(std::string(name) + " exceeds " + std::to_string(max));
        return parsed;
    }

    bool env_bool(const char* name, bool fallback)
    {
        const char* v = env(name);
        if (!v)
            return fallback;
        const std::string s(v);
        if (s == "1" || s == "true" || s == "TRUE" || s == "yes")
            return true;
        if (s == "0" || s == "false" || s == "FALSE" || s == "no")
            return false;
        throw std::runtime_error(std::string(name) + " is not a boolean: '" + s + "'");
    }
}

bool load_env_file(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open()) {
        // Try in backend directory if not found
        file.open("backend/" + filepath);
        if (!file.is_open()) {
            return false; // .env file not found, will use system env vars
        }
    }

    std::string line;
    while (std::getline(file, line)) {
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);
        trim(key);
        trim(value);
        if (key.empty()) {
            continue;
        }

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        setenv(key.c_str(), value.c_str(), 0); // 0 = don't overwrite existing
    }
    return true;
}

MarketSettings market_settings_from_env()
{
    MarketSettings s;
    s.marketplace_fee_bps = static_cast<std::uint32_t>(
        env_uint("AUCTIONHOUSE_MARKETPLACE_FEE_BPS", s.marketplace_fee_bps, kMaxMarketplaceFeeBps));
    s.referrer_bps = static_cast<std::uint32_t>(
        env_uint("AUCTIONHOUSE_REFERRER_BPS", s.referrer_bps, kMaxReferrerBps));
    s.enabled = env_bool("AUCTIONHOUSE_ENABLED", s.enabled);
    s.rescind.offers_only_rescind_delay = env_uint("AUCTIONHOUSE_OFFERS_ONLY_RESCIND_DELAY",
                                                   s.rescind.offers_only_rescind_delay, UINT32_MAX);

    if (const char* custody = env("AUCTIONHOUSE_CUSTODY_ADDRESS"))
        s.custody_address = custody;
    if (const char* registry = env("AUCTIONHOUSE_SELLER_REGISTRY"))
        s.seller_registry = registry;

    if (const char* admins = env("AUCTIONHOUSE_ADMINS")) {
        std::string list(admins);
        std::size_t pos = 0;
        while (pos <= list.size()) {
            std::size_t comma = list.find(',', pos);
            if (comma == std::string::npos)
                comma = list.size();
            std::string admin = list.substr(pos, comma - pos);
            trim(admin);
            if (!admin.empty())
                s.admins.insert(admin);
            pos = comma + 1;
        }
    }

    if (s.admins.empty())
        market_log("setup", "no administrators configured; fee withdrawal and admin cancel are unavailable");
    return s;
}

std::string journal_connection_string()
{
    if (const char* db_url = env("AUCTIONHOUSE_DB_URL")) {
        return std::string(db_url);
    }

    // Alternative: build from individual components
    const char* host = env("AUCTIONHOUSE_DB_HOST");
    const char* password = env("AUCTIONHOUSE_DB_PASSWORD");
    const char* port = env("AUCTIONHOUSE_DB_PORT");

    if (host && password) {
        std::string port_str = port ? std::string(port) : "5432";
        return "postgresql://postgres:" + std::string(password) + "@" +
               std::string(host) + ":" + port_str + "/postgres?sslmode=require";
    }

    throw std::runtime_error(
        "Journal connection string not found. "
        "Set AUCTIONHOUSE_DB_URL or AUCTIONHOUSE_DB_HOST + AUCTIONHOUSE_DB_PASSWORD environment variables.");
}
