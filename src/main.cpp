#include <csignal>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <pthread.h>

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "providers/IProvider.hpp"
#include "providers/ProviderFactory.hpp"
#include "providers/Rfc2136Provider.hpp"

namespace po = boost::program_options;

namespace {

void printRecords(const std::vector<rfc2136::common::Record>& vRecords) {
  for (const auto& rec : vRecords) {
    std::cout << rec.sName << ' ' << rec.durTtl.count() << ' ' << rec.sType << ' ' << rec.sValue
              << "\n";
  }
}

int report(const rfc2136::common::ChangeResult& cr) {
  printRecords(cr.vApplied);
  if (!cr.bSuccess) {
    std::cerr << "[error] " << cr.sErrorCode << ": " << cr.sErrorMessage << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

/// Turns SIGINT/SIGTERM into a stop request. The signals must already be
/// blocked in every thread.
std::jthread startSignalWatcher(std::stop_source& ssSource, const sigset_t& ssSignals) {
  return std::jthread([&ssSource, ssSignals](std::stop_token stSelf) {
    const timespec tsSlice{0, 100'000'000};
    while (!stSelf.stop_requested()) {
      if (sigtimedwait(&ssSignals, nullptr, &tsSlice) > 0) {
        ssSource.request_stop();
        return;
      }
    }
  });
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    std::string sCommand;
    std::string sZone;
    std::string sConfigFile;
    rfc2136::common::Record rec;
    int64_t iTtl = 0;

    po::options_description desc("Usage: rfc2136ctl <list|append|set|delete> [options]");
    desc.add_options()
        ("help,h", "show this help")
        ("command", po::value<std::string>(&sCommand), "list, append, set or delete")
        ("zone,z", po::value<std::string>(&sZone), "zone to operate on")
        ("name,n", po::value<std::string>(&rec.sName), "record name")
        ("type,t", po::value<std::string>(&rec.sType), "record type (A, AAAA, CNAME, MX, TXT)")
        ("value,v", po::value<std::string>(&rec.sValue), "record value")
        ("ttl", po::value<int64_t>(&iTtl)->default_value(3600), "record TTL in seconds")
        ("config,c", po::value<std::string>(&sConfigFile),
         "provider configuration JSON (default: RFC2136_* environment)");

    po::positional_options_description posDesc;
    posDesc.add("command", 1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(desc).positional(posDesc).run(), vm);
    po::notify(vm);

    if (vm.count("help") || sCommand.empty()) {
      std::cout << desc << "\n";
      return sCommand.empty() && !vm.count("help") ? EXIT_FAILURE : EXIT_SUCCESS;
    }
    if (sZone.empty()) {
      throw rfc2136::common::ValidationError("--zone is required");
    }

    // ── Configuration and provider ───────────────────────────────────────
    std::unique_ptr<rfc2136::providers::IProvider> upProvider;
    if (!sConfigFile.empty()) {
      std::ifstream ifs(sConfigFile);
      if (!ifs.is_open()) {
        throw rfc2136::common::ValidationError("Cannot open config file: " + sConfigFile);
      }
      nlohmann::json jConfig;
      try {
        jConfig = nlohmann::json::parse(ifs);
      } catch (const nlohmann::json::parse_error& ex) {
        throw rfc2136::common::ValidationError("Config file " + sConfigFile +
                                               " is not valid JSON: " + ex.what());
      }
      rfc2136::common::Logger::init(jConfig.value("log_level", std::string("info")));
      upProvider = rfc2136::providers::ProviderFactory::create("rfc2136", jConfig);
    } else {
      auto cfgApp = rfc2136::common::Config::load();
      rfc2136::common::Logger::init(cfgApp.sLogLevel);
      upProvider = std::make_unique<rfc2136::providers::Rfc2136Provider>(cfgApp.pcProvider);
      if (cfgApp.pcProvider.oTsig) {
        auto& sSecret = cfgApp.pcProvider.oTsig->sSecret;
        OPENSSL_cleanse(sSecret.data(), sSecret.size());
        sSecret.clear();
      }
    }
    auto spLog = rfc2136::common::Logger::get();

    // ── Cancellation on SIGINT/SIGTERM ───────────────────────────────────
    sigset_t ssSignals;
    sigemptyset(&ssSignals);
    sigaddset(&ssSignals, SIGINT);
    sigaddset(&ssSignals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &ssSignals, nullptr);

    std::stop_source ssSource;
    std::jthread jtWatcher = startSignalWatcher(ssSource, ssSignals);
    const std::stop_token stToken = ssSource.get_token();

    // ── Dispatch ─────────────────────────────────────────────────────────
    if (sCommand == "list") {
      const auto lr = upProvider->getRecords(sZone, stToken);
      if (!lr.bSuccess) {
        std::cerr << "[error] " << lr.sErrorCode << ": " << lr.sErrorMessage << "\n";
        return EXIT_FAILURE;
      }
      printRecords(lr.vRecords);
      return EXIT_SUCCESS;
    }

    if (sCommand != "append" && sCommand != "set" && sCommand != "delete") {
      throw rfc2136::common::ValidationError("Unknown command: " + sCommand);
    }
    if (rec.sName.empty() || rec.sType.empty() || !vm.count("value")) {
      throw rfc2136::common::ValidationError(sCommand + " requires --name, --type and --value");
    }
    rec.durTtl = std::chrono::seconds(iTtl);
    const std::vector<rfc2136::common::Record> vRecords{rec};

    spLog->debug("Running {} on zone {} via {}", sCommand, sZone, upProvider->name());
    if (sCommand == "append") return report(upProvider->appendRecords(sZone, vRecords, stToken));
    if (sCommand == "set") return report(upProvider->setRecords(sZone, vRecords, stToken));
    return report(upProvider->deleteRecords(sZone, vRecords, stToken));
  } catch (const po::error& ex) {
    std::cerr << "[fatal] " << ex.what() << "\n";
    return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
