#include "convmem/capture/ConfigManager.h"
#include "convmem/capture/ErrorHandler.h"
#include "convmem/capture/SessionManager.h"
#include "convmem/capture/audio/MiniaudioMicrophone.h"
#include "convmem/capture/gateways/DeepgramTranscriptionGateway.h"
#include "convmem/capture/gateways/HttpAnalysisGateway.h"
#include "convmem/capture/gateways/SqlitePersistenceGateway.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/streambuf.hpp>

#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <istream>
#include <memory>
#include <string>

using convmem::capture::ConfigManager;
using convmem::capture::ErrorHandler;
using convmem::capture::ErrorInfo;
using convmem::capture::SessionManager;
using convmem::capture::SessionRequest;
namespace audio = convmem::capture::audio;
namespace gateways = convmem::capture::gateways;
namespace net = boost::asio;

namespace {

void printHelp() {
    std::cout << "Commands:\n"
              << "  /recent  - show the 20 most recent transcripts\n"
              << "  /stats   - show session statistics\n"
              << "  /devices - list capture devices\n"
              << "  /stop    - stop the session and exit (also Ctrl+C)\n"
              << "  /help    - show this help\n\n";
}

void printRecent(const SessionManager& manager, const std::string& sessionId) {
    ErrorInfo err;
    auto recent = manager.recentTranscripts(sessionId, 20, &err);
    if (!recent) {
        std::cerr << "[ERR ] " << err.toString() << "\n";
        return;
    }
    for (const auto& e : recent->entries) {
        std::cout << "[" << e.timestamp << "] " << e.text << "\n";
    }
    if (recent->detectedPartnerName) {
        std::cout << "Partner: " << *recent->detectedPartnerName << "\n";
    }
}

struct Console {
    net::posix::stream_descriptor input;
    net::streambuf buffer;
    explicit Console(net::io_context& ioc) : input(ioc, ::dup(STDIN_FILENO)) {}
};

} // namespace

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "config/convmem_config.json";
    const std::string sessionId = argc > 2 ? argv[2] : "live-session";
    const std::int64_t userId = argc > 3 ? std::atoll(argv[3]) : 1;
    const std::int64_t partnerId = argc > 4 ? std::atoll(argv[4]) : 1;

    ConfigManager cfg;
    ErrorInfo err;
    if (!cfg.loadFromFile(configPath, &err)) {
        std::cerr << "Failed to load config: " << err.toString() << "\n";
        return 1;
    }
    if (!err.message.empty()) {
        std::cerr << "[WARN] " << err.message << "\n";
        err = ErrorInfo{};
    }
    cfg.applyEnvironmentOverrides();

    const auto issues = cfg.validate();
    for (const auto& s : issues) {
        std::cerr << (s.rfind("WARN:", 0) == 0 ? "[WARN] " : "[ERR ] ") << s << "\n";
    }
    if (ConfigManager::hasHardValidationErrors(issues)) {
        return 1;
    }

    ErrorHandler::LoggerConfig logCfg;
    if (auto lvl = ErrorHandler::parseLogLevel(cfg.getString("logging.min_level", "info"))) {
        logCfg.minLevel = *lvl;
    }
    auto logger = std::make_shared<ErrorHandler>(logCfg);

    gateways::SqlitePersistenceGateway::Options dbOpts;
    dbOpts.path = cfg.getString("persistence.sqlite_path", "data/convmem.db");
    dbOpts.busyTimeoutMs = static_cast<int>(cfg.getInt("persistence.busy_timeout_ms", 5000));

    gateways::HttpAnalysisGateway::Options analysisOpts;
    analysisOpts.enabled = cfg.getBool("analysis.enabled", true);
    analysisOpts.baseUrl = cfg.getString("analysis.base_url", "");
    analysisOpts.apiKey = cfg.getString("analysis.api_key", "");
    analysisOpts.path = cfg.getString("analysis.path", analysisOpts.path);
    analysisOpts.timeoutMs = static_cast<int>(cfg.getInt("analysis.timeout_ms", 60000));
    auto analysis = std::make_shared<gateways::HttpAnalysisGateway>(analysisOpts, *logger);

    auto manager = std::make_unique<SessionManager>(
        SessionManager::Settings::fromConfig(cfg),
        gateways::SqlitePersistenceGateway::factory(dbOpts),
        std::make_shared<gateways::DeepgramTranscriptionGateway>(*logger),
        analysis,
        []() { return std::make_unique<audio::MiniaudioMicrophone>(); },
        logger);

    SessionRequest req;
    req.sessionId = sessionId;
    req.userId = userId;
    req.partnerId = partnerId;

    auto stats = manager->createSession(req, &err);
    if (!stats) {
        std::cerr << "Failed to create session: " << err.toString() << "\n";
        return 1;
    }
    std::cout << stats->toJson().dump(2) << "\n\n";
    printHelp();

    net::io_context ioc;
    net::signal_set signals(ioc, SIGINT, SIGTERM);
    net::steady_timer ticker(ioc);
    Console console(ioc);
    std::string lastPrinted;

    auto shutdown = [&]() {
        signals.cancel();
        ticker.cancel();
        console.input.cancel();
    };

    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (!ec) shutdown();
    });

    // 每秒打印新到达的定稿片段
    std::function<void()> tick = [&]() {
        ticker.expires_after(std::chrono::seconds(1));
        ticker.async_wait([&](const boost::system::error_code& ec) {
            if (ec) return;
            if (auto recent = manager->recentTranscripts(sessionId, 100)) {
                const auto& entries = recent->entries;
                std::size_t from = 0;
                for (std::size_t i = entries.size(); i > 0; --i) {
                    if (entries[i - 1].datetime == lastPrinted) {
                        from = i;
                        break;
                    }
                }
                for (std::size_t i = from; i < entries.size(); ++i) {
                    std::cout << "[" << entries[i].timestamp << "] " << entries[i].text << "\n";
                    lastPrinted = entries[i].datetime;
                }
            }
            tick();
        });
    };
    tick();

    std::function<void()> readCommand = [&]() {
        net::async_read_until(console.input, console.buffer, '\n',
                              [&](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                shutdown();
                return;
            }
            std::istream is(&console.buffer);
            std::string line;
            std::getline(is, line);

            if (line == "/stop" || line == "/exit") {
                shutdown();
                return;
            }
            if (line == "/recent") {
                printRecent(*manager, sessionId);
            } else if (line == "/stats") {
                if (auto s = manager->getSession(sessionId)) std::cout << s->toJson().dump(2) << "\n";
            } else if (line == "/devices") {
                for (const auto& name : audio::MiniaudioMicrophone::listCaptureDevices()) {
                    std::cout << "  " << name << "\n";
                }
            } else if (line == "/help") {
                printHelp();
            }
            readCommand();
        });
    };
    readCommand();

    ioc.run();

    std::cout << "\nStopping session...\n";
    if (!manager->stopSession(sessionId, &err)) {
        std::cerr << "Stop failed: " << err.toString() << "\n";
    }
    manager.reset();
    analysis->waitIdle();
    return 0;
}
