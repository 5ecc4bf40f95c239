#include "RelayConfig.h"
#include <libshieldpool/ledger/RpcClient.h>
#include <libshieldpool/zkp/AssetId.h>
#include <xrpl/basics/Log.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace shieldpool {
namespace relay {

namespace {

// Typed reads from one section. A missing section reads as empty.
class SectionReader
{
public:
    SectionReader(ripple::BasicConfig const& config, std::string name)
        : section_(config.section(name)), name_(std::move(name))
    {
    }

    std::runtime_error
    error(std::string const& key, std::string const& what) const
    {
        return std::runtime_error("[" + name_ + "] " + key + ": " + what);
    }

    std::optional<std::string>
    text(std::string const& key) const
    {
        return section_.get<std::string>(key);
    }

    std::string
    required(std::string const& key) const
    {
        auto const value = text(key);
        if (!value || value->empty())
            throw error(key, "required");
        return *value;
    }

    std::int64_t
    integer(std::string const& key, std::int64_t fallback, std::int64_t min, std::int64_t max)
        const
    {
        std::optional<std::int64_t> value;
        try
        {
            value = section_.get<std::int64_t>(key);
        }
        catch (boost::bad_lexical_cast const&)
        {
            throw error(key, "not an integer");
        }

        auto const result = value.value_or(fallback);
        if (result < min || result > max)
        {
            throw error(
                key, "must be between " + std::to_string(min) + " and " + std::to_string(max));
        }
        return result;
    }

    bool
    flag(std::string const& key, bool fallback) const
    {
        auto const value = text(key);
        if (!value)
            return fallback;

        auto const v = boost::algorithm::to_lower_copy(*value);
        if (v == "1" || v == "true" || v == "yes")
            return true;
        if (v == "0" || v == "false" || v == "no")
            return false;
        throw error(key, "expected 0 or 1");
    }

    ledger::Address
    address(std::string const& key, std::optional<std::string> const& fallback) const
    {
        auto const value = text(key);
        if (!value && !fallback)
            throw error(key, "required");

        auto const parsed = ledger::parseAddress(value ? *value : *fallback);
        if (!parsed)
            throw error(key, "not a base58 32-byte address");
        return *parsed;
    }

    std::vector<std::string> const&
    values() const
    {
        return section_.values();
    }

private:
    ripple::Section const& section_;
    std::string const name_;
};

ripple::uint256
parseAsset(std::string const& line)
{
    ripple::uint256 assetId;
    if (line.size() == 64 && assetId.parseHex(line))
    {
        if (!zkp::field::isCanonical(assetId))
            throw std::runtime_error("[supported_assets] " + line + ": not a field element");
        return assetId;
    }

    if (auto const mint = ledger::parseAddress(line))
        return zkp::deriveAssetId(ledger::slice(*mint));

    throw std::runtime_error(
        "[supported_assets] " + line + ": expected a 64-hex asset id or a base58 mint");
}

} // namespace

ripple::BasicConfig
RelayConfig::parse(std::string const& text)
{
    ripple::BasicConfig config;
    std::string section;
    std::vector<std::string> lines;

    auto flush = [&] {
        if (!section.empty() || !lines.empty())
            config.section(section).append(lines);
        lines.clear();
    };

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        boost::algorithm::trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        if (line.front() == '[' && line.back() == ']')
        {
            flush();
            section = line.substr(1, line.size() - 2);
            boost::algorithm::trim(section);
            continue;
        }
        lines.push_back(line);
    }
    flush();
    return config;
}

RelayConfig
RelayConfig::loadFile(std::string const& path)
{
    std::ifstream file(path);
    if (!file)
        throw std::runtime_error("cannot open configuration file " + path);

    std::stringstream contents;
    contents << file.rdbuf();
    return load(parse(contents.str()));
}

RelayConfig
RelayConfig::load(ripple::BasicConfig const& config)
{
    RelayConfig c;

    {
        SectionReader const s(config, "server");
        c.ip = s.text("ip").value_or(c.ip);
        c.port = static_cast<std::uint16_t>(s.integer("port", c.port, 1, 65535));
        c.ioThreads = static_cast<unsigned>(s.integer("io_threads", c.ioThreads, 1, 64));
        c.workerThreads =
            static_cast<unsigned>(s.integer("worker_threads", c.workerThreads, 1, 256));
    }

    {
        SectionReader const s(config, "ledger");
        c.rpcUrl = s.required("rpc_url");
        try
        {
            (void)ledger::RpcClient::parseUrl(c.rpcUrl);
        }
        catch (std::invalid_argument const& e)
        {
            throw s.error("rpc_url", e.what());
        }

        c.commitment = s.text("commitment").value_or(c.commitment);
        if (c.commitment != "processed" && c.commitment != "confirmed" &&
            c.commitment != "finalized")
        {
            throw s.error("commitment", "must be processed, confirmed or finalized");
        }
        c.rpcTimeout =
            std::chrono::milliseconds(s.integer("timeout_ms", c.rpcTimeout.count(), 100, 600000));
        c.confirmTimeout = std::chrono::milliseconds(
            s.integer("confirm_timeout_ms", c.confirmTimeout.count(), 1000, 600000));
    }

    c.keypairFile = SectionReader(config, "operator").required("keypair_file");

    {
        SectionReader const s(config, "pool");
        c.pool.programId = s.address("program_id", std::string(defaultProgramId));
        c.pool.poolConfig = s.address("pool_config", std::nullopt);
        c.pool.tokenProgram = s.address("token_program", std::string(ledger::tokenProgramIdBase58));
        c.pool.associatedTokenProgram = s.address(
            "associated_token_program", std::string(ledger::associatedTokenProgramIdBase58));
        c.pool.registeredRelayer = s.flag("registered_relayer", false);
    }

    c.pipeline.feeBps = static_cast<std::uint16_t>(
        SectionReader(config, "fees").integer("fee_bps", c.pipeline.feeBps, 0, maxFeeBps));

    {
        SectionReader const s(config, "withdrawal_limits");
        auto constexpr largest = std::numeric_limits<std::int64_t>::max() / 10000;
        auto const minAmount = s.integer("min", c.pipeline.minAmount, 1, largest);
        auto const maxAmount = s.integer("max", c.pipeline.maxAmount, 1, largest);
        if (minAmount > maxAmount)
            throw s.error("min", "must not exceed max");
        c.pipeline.minAmount = static_cast<std::uint64_t>(minAmount);
        c.pipeline.maxAmount = static_cast<std::uint64_t>(maxAmount);
    }

    c.verificationKeyPath = SectionReader(config, "verification_key").required("path");

    for (auto const& line : SectionReader(config, "supported_assets").values())
        c.pipeline.supportedAssets.insert(parseAsset(line));
    if (c.pipeline.supportedAssets.empty())
        throw std::runtime_error("[supported_assets] must list at least one asset");

    {
        SectionReader const s(config, "rate_limit");
        c.rateLimit.window = std::chrono::seconds(
            s.integer("window_seconds", c.rateLimit.window.count(), 1, 86400));
        c.rateLimit.perKey =
            static_cast<unsigned>(s.integer("per_key", c.rateLimit.perKey, 1, 1000000));
        c.rateLimit.global =
            static_cast<unsigned>(s.integer("global", c.rateLimit.global, 1, 10000000));
    }

    {
        SectionReader const s(config, "retry");
        c.retry.maxAttempts =
            static_cast<unsigned>(s.integer("max_attempts", c.retry.maxAttempts, 1, 10));
        c.retry.baseDelay = std::chrono::milliseconds(
            s.integer("base_delay_ms", c.retry.baseDelay.count(), 0, 60000));
        c.retry.maxJitter = std::chrono::milliseconds(
            s.integer("max_jitter_ms", c.retry.maxJitter.count(), 0, 60000));
        c.retry.overallTimeout = std::chrono::milliseconds(
            s.integer("overall_timeout_ms", c.retry.overallTimeout.count(), 1000, 600000));
    }

    c.nullifierCacheEnabled = SectionReader(config, "nullifier_cache").flag("enabled", true);

    if (auto const level = config.legacy("log_level"); !level.empty())
    {
        auto const severity = ripple::Logs::fromString(level);
        if (severity == ripple::lsINVALID)
            throw std::runtime_error("[log_level] unknown severity " + level);
        c.logLevel = ripple::Logs::toSeverity(severity);
    }
    c.debugLogfile = config.legacy("debug_logfile");

    return c;
}

} // namespace relay
} // namespace shieldpool
