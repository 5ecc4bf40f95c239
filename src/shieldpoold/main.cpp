#include <libshieldpool/ledger/Keypair.h>
#include <libshieldpool/ledger/RpcClient.h>
#include <libshieldpool/ledger/SolanaLedger.h>
#include <libshieldpool/ledger/WithdrawInstruction.h>
#include <libshieldpool/relay/HttpServer.h>
#include <libshieldpool/relay/NullifierCache.h>
#include <libshieldpool/relay/RateLimiter.h>
#include <libshieldpool/relay/RelayConfig.h>
#include <libshieldpool/relay/RelayPipeline.h>
#include <libshieldpool/relay/RelayService.h>
#include <libshieldpool/relay/RetryPolicy.h>
#include <libshieldpool/zkp/HashEngine.h>
#include <libshieldpool/zkp/ProofCodec.h>
#include <libshieldpool/zkp/ProofVerifier.h>
#include <xrpl/basics/Log.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <vector>

namespace po = boost::program_options;

namespace shieldpool {

namespace {

int
run(relay::RelayConfig const& config, ripple::Logs& logs)
{
    auto j = logs.journal("Relay");

    zkp::HashEngine hasher;
    auto hasherReady = hasher.initializeAsync();

    zkp::ProofCodec::selfTest();
    auto const verifier = zkp::Groth16Verifier::fromFile(config.verificationKeyPath);
    auto const operatorKey = ledger::Keypair::loadFromFile(config.keypairFile);

    // rethrows a failed known-answer check
    hasherReady.get();
    JLOG(j.info()) << "hash engine ready: " << hasher.parameterSet();

    ledger::RpcClient rpc(config.rpcUrl, config.rpcTimeout, logs.journal("Ledger"));

    ledger::SolanaLedger::Setup ledgerSetup;
    ledgerSetup.commitment = config.commitment;
    ledgerSetup.confirmTimeout = config.confirmTimeout;
    ledger::SolanaLedger solana(rpc, ledgerSetup, logs.journal("Ledger"));

    ledger::PoolAddresses const pool(config.pool);
    auto const cache = relay::make_NullifierCache(config.nullifierCacheEnabled);
    relay::RetryPolicy const retry(config.retry, logs.journal("Retry"));

    relay::RelayPipeline pipeline(
        config.pipeline,
        *verifier,
        solana,
        operatorKey,
        pool,
        *cache,
        retry,
        logs.journal("Pipeline"));

    relay::RateLimiter limiter(config.rateLimit);
    relay::RelayService service(pipeline, limiter, logs.journal("Relay"));

    boost::asio::io_context io;
    boost::asio::thread_pool workers(config.workerThreads);

    relay::HttpServer::Setup serverSetup;
    serverSetup.ip = config.ip;
    serverSetup.port = config.port;
    relay::HttpServer server(serverSetup, io, workers, service, logs.journal("Server"));
    server.start();

    std::cout << "shieldpoold operator " << ledger::toBase58(pipeline.operatorAddress())
              << ", fee " << config.pipeline.feeBps << " bps, listening on "
              << server.localEndpoint() << std::endl;

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](boost::system::error_code const& ec, int signal) {
        if (ec)
            return;
        JLOG(j.info()) << "signal " << signal << ", shutting down";
        server.stop();
        io.stop();
    });

    std::vector<std::thread> threads;
    threads.reserve(config.ioThreads - 1);
    for (unsigned i = 1; i < config.ioThreads; ++i)
        threads.emplace_back([&io] { io.run(); });
    io.run();
    for (auto& t : threads)
        t.join();

    workers.join();
    JLOG(j.info()) << "stopped after " << pipeline.totalTransactions() << " withdrawals";
    return EXIT_SUCCESS;
}

} // namespace

} // namespace shieldpool

int
main(int argc, char** argv)
{
    std::string configFile;

    po::options_description desc("shieldpoold options");
    // clang-format off
    desc.add_options()
        ("help,h", "Display this message.")
        ("conf", po::value<std::string>(&configFile)->default_value("shieldpoold.cfg"),
            "Specify the configuration file.");
    // clang-format on

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
    }
    catch (po::error const& e)
    {
        std::cerr << "shieldpoold: " << e.what() << "\n" << desc << std::endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help"))
    {
        std::cout << desc << std::endl;
        return EXIT_SUCCESS;
    }

    shieldpool::relay::RelayConfig config;
    try
    {
        config = shieldpool::relay::RelayConfig::loadFile(configFile);
    }
    catch (std::exception const& e)
    {
        std::cerr << "shieldpoold: " << configFile << ": " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    ripple::Logs logs(config.logLevel);
    if (!config.debugLogfile.empty() && !logs.open(config.debugLogfile))
    {
        std::cerr << "shieldpoold: cannot open log file " << config.debugLogfile << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        return shieldpool::run(config, logs);
    }
    catch (std::exception const& e)
    {
        auto j = logs.journal("Relay");
        JLOG(j.fatal()) << e.what();
        return EXIT_FAILURE;
    }
}
