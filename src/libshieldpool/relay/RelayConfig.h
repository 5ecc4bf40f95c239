#pragma once

#include <libshieldpool/ledger/WithdrawInstruction.h>
#include <libshieldpool/relay/RateLimiter.h>
#include <libshieldpool/relay/RelayPipeline.h>
#include <libshieldpool/relay/RetryPolicy.h>
#include <xrpl/basics/BasicConfig.h>
#include <xrpl/beast/utility/Journal.h>
#include <chrono>
#include <optional>
#include <string>

namespace shieldpool {
namespace relay {

/**
    Everything shieldpoold reads from its configuration file.

    Sections and defaults:

        [server]            ip=0.0.0.0 port=3000 io_threads=2 worker_threads=4
        [ledger]            rpc_url (required) commitment=confirmed
                            timeout_ms=15000 confirm_timeout_ms=30000
        [operator]          keypair_file (required)
        [pool]              pool_config (required) program_id registered_relayer=0
                            token_program associated_token_program
        [fees]              fee_bps=50
        [withdrawal_limits] min=1000000 max=1000000000000
        [verification_key]  path (required)
        [supported_assets]  one asset id (64 hex) or mint (base58) per line
        [rate_limit]        window_seconds=60 per_key=30 global=500
        [retry]             max_attempts=3 base_delay_ms=1000 max_jitter_ms=500
                            overall_timeout_ms=30000
        [nullifier_cache]   enabled=1
        [log_level]         trace|debug|info|warning|error|fatal
        [debug_logfile]     path
*/
struct RelayConfig
{
    static constexpr char defaultProgramId[] = "BmtMrkgvVML9Gk7Bt6JRqweHAwW69oFTohaBRaLbgqpb";
    static constexpr std::uint16_t maxFeeBps = 1000;

    std::string ip = "0.0.0.0";
    std::uint16_t port = 3000;
    unsigned ioThreads = 2;
    unsigned workerThreads = 4;

    std::string rpcUrl;
    std::string commitment = "confirmed";
    std::chrono::milliseconds rpcTimeout{15000};
    std::chrono::milliseconds confirmTimeout{30000};

    std::string keypairFile;
    ledger::PoolSettings pool;
    std::string verificationKeyPath;

    PipelineSetup pipeline;
    RateLimiter::Setup rateLimit;
    RetrySetup retry;
    bool nullifierCacheEnabled = true;

    beast::severities::Severity logLevel = beast::severities::kInfo;
    std::string debugLogfile;

    /** @throws std::runtime_error naming the offending section and key */
    static RelayConfig
    load(ripple::BasicConfig const& config);

    /** Parses INI text; '#' starts a comment line. */
    static ripple::BasicConfig
    parse(std::string const& text);

    /** @throws std::runtime_error if unreadable or invalid */
    static RelayConfig
    loadFile(std::string const& path);
};

} // namespace relay
} // namespace shieldpool
