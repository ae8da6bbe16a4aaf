#include <cxxopts.hpp>

#include "ConnectionDiagnostics.hpp"
#include "Headers.hpp"
#include "LogHandler.hpp"
#include "OrchestrationBus.hpp"
#include "ProcessRegistry.hpp"
#include "TcpSocketHandler.hpp"
#include "TunnelBinary.hpp"
#include "TunnelProcess.hpp"

using namespace td;

namespace {
volatile sig_atomic_t interrupted = 0;

void interruptSignalHandler(int signum) { interrupted = signum; }

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

template <class T, class DefaultT>
T extractSingleOptionWithDefault(const cxxopts::ParseResult& result,
                                 const cxxopts::Options& options,
                                 const string& name, DefaultT defaultValue) {
  auto count = result.count(name);
  if (count == 0) {
    return defaultValue;
  }
  if (count == 1) {
    return result[name].as<T>();
  }
  CLOG(INFO, "stdout") << "Value for " << name
                       << " must be specified only once\n";
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(0);
}

string resolveTunnelBinary(const string& overridePath) {
  auto binary = TunnelBinary::find(overridePath);
  if (!binary) {
    return "";
  }
  LOG(INFO) << "Using tunnel binary " << *binary;
  return *binary;
}

int runHost(shared_ptr<SubprocessUtils> subprocessUtils,
            shared_ptr<ProcessRegistry> processRegistry,
            const BusConfig& busConfig) {
  auto tunnelLauncher =
      make_shared<ProcessTunnelLauncher>(subprocessUtils, processRegistry);
  OrchestrationBus bus(tunnelLauncher, nullptr, busConfig);

  int exitCode = 0;
  bool sawHosting = false;
  bool shutdownPosted = false;
  string printedUrl;
  bus.setScreenObserver([&](const Screen& screen) {
    if (screen.type == ScreenType::Hosting) {
      if (!sawHosting) {
        sawHosting = true;
        CLOG(INFO, "stdout") << "Starting tunnel to localhost:"
                             << busConfig.hostServicePort << "..." << endl;
      }
      if (!screen.hostingUrl.empty() && screen.hostingUrl != printedUrl) {
        printedUrl = screen.hostingUrl;
        CLOG(INFO, "stdout") << "Hosting at " << printedUrl << endl;
        CLOG(INFO, "stdout") << "Press Ctrl+C to stop." << endl;
      }
      return;
    }
    if (shutdownPosted) {
      return;
    }
    if (screen.type == ScreenType::ErrorDisplay) {
      CLOG(INFO, "stdout") << "Error: " << screen.errorMessage << endl;
      exitCode = 1;
      shutdownPosted = true;
      bus.post(BusMessage::intent(BusMessageType::Shutdown));
    } else if (screen.type == ScreenType::ModeSelect && sawHosting) {
      CLOG(INFO, "stdout") << "Tunnel stopped" << endl;
      shutdownPosted = true;
      bus.post(BusMessage::intent(BusMessageType::Shutdown));
    }
  });

  bus.post(BusMessage::intent(BusMessageType::SelectHost));
  while (!bus.isFinished()) {
    if (interrupted && !shutdownPosted) {
      CLOG(INFO, "stdout") << endl << "Stopping tunnel..." << endl;
      shutdownPosted = true;
      bus.post(BusMessage::intent(BusMessageType::Shutdown));
    }
    bus.processNext(100);
  }
  return exitCode;
}

int runAccess(shared_ptr<SubprocessUtils> subprocessUtils,
              shared_ptr<ProcessRegistry> processRegistry,
              const TunnelParams& params) {
  BoundedQueue<TunnelEvent> events(0);
  TunnelProcess tunnel(subprocessUtils, processRegistry, params,
                       [&events](const TunnelEvent& event) {
                         events.push(event);
                       });
  tunnel.start();

  int exitCode = 0;
  while (true) {
    if (interrupted) {
      tunnel.requestStop();
    }
    auto event = events.pop(100);
    if (!event) {
      continue;
    }
    if (event->type == TunnelEventType::HandleReady) {
      CLOG(INFO, "stdout") << "Forwarding localhost:" << params.localPort
                           << " to " << params.tunnelUrl << endl;
      CLOG(INFO, "stdout") << "Point your remote desktop client at localhost:"
                           << params.localPort << ". Press Ctrl+C to stop."
                           << endl;
    } else if (event->type == TunnelEventType::Error) {
      CLOG(INFO, "stdout") << "Error: " << event->text << endl;
      exitCode = 1;
    } else if (event->type == TunnelEventType::Stopped) {
      break;
    }
  }
  tunnel.join();
  return exitCode;
}

int runProbe(int proxyPort) {
  shared_ptr<SocketHandler> socketHandler(new TcpSocketHandler());
  shared_ptr<TransportFactory> transportFactory(
      new TcpTransportFactory(socketHandler));
  ConnectionDiagnostics diagnostics(transportFactory,
                                    DIAGNOSTIC_READ_TIMEOUT_MS);
  Diagnosis diagnosis = diagnostics.probe(SocketEndpoint("localhost", proxyPort));
  CLOG(INFO, "stdout") << diagnosis.describe() << endl;
  return diagnosis.kind == DiagnosisKind::UnexpectedResponse ? 0 : 1;
}
}  // namespace

int main(int argc, char** argv) {
  string tmpDir = GetTempDirectory();

  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  td::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, interruptSignalHandler);
  ::signal(SIGTERM, interruptSignalHandler);
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("tunneldesk",
                           "Remote desktop through an outbound tunnel");
  int exitCode = 0;
  try {
    options.positional_help("");
    options.custom_help(
        "[OPTION...] host|access <url>|probe|connect <url>\n\n"
        "  host     share this machine's remote desktop service through a "
        "tunnel\n"
        "  access   bind a hosted tunnel to a local port for an external "
        "client\n"
        "  probe    check what answers on the local end of the tunnel\n"
        "  connect  validate a connection and optionally save its profile");

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("mode", "host, access, probe or connect",
         cxxopts::value<std::string>())  //
        ("url", "Tunnel URL of the hosted desktop",
         cxxopts::value<std::string>())  //
        ("u,username", "Username on the remote desktop",
         cxxopts::value<std::string>())  //
        ("password-stdin", "Read the password from the first line of stdin")  //
        ("width", "Desktop width",
         cxxopts::value<std::string>()->default_value("1920"))  //
        ("height", "Desktop height",
         cxxopts::value<std::string>()->default_value("1080"))  //
        ("proxy-port", "Local port the client tunnel listens on",
         cxxopts::value<int>()->default_value(
             to_string(DEFAULT_CLIENT_PROXY_PORT)))  //
        ("service-port", "Local remote desktop port exposed when hosting",
         cxxopts::value<int>()->default_value(
             to_string(DEFAULT_SERVICE_PORT)))  //
        ("cloudflared", "Path to the cloudflared binary",
         cxxopts::value<std::string>())  //
        ("profile", "Load connection settings from a JSON profile",
         cxxopts::value<std::string>())  //
        ("save-profile", "Save the connection settings to a JSON profile",
         cxxopts::value<std::string>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"))  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>()->default_value(tmpDir))  //
        ("logtostdout", "Write log to stdout");

    options.parse_positional({"mode", "url"});
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tunneldesk version " << TD_VERSION << endl;
      exit(0);
    }

    el::Loggers::setVerboseLevel(result["verbose"].as<int>());

    LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                              "tunneldesk", result.count("logtostdout"),
                              false);

    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("main");

    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    if (!result.count("mode")) {
      CLOG(INFO, "stdout") << "Missing mode" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }
    string mode = result["mode"].as<string>();
    int proxyPort = result["proxy-port"].as<int>();
    int servicePort = result["service-port"].as<int>();
    string cloudflaredOverride = extractSingleOptionWithDefault<string>(
        result, options, "cloudflared", "");

    auto subprocessUtils = make_shared<SubprocessUtils>();
    auto processRegistry = make_shared<ProcessRegistry>(subprocessUtils);

    if (mode == "host") {
      BusConfig busConfig;
      busConfig.tunnelBinary = resolveTunnelBinary(cloudflaredOverride);
      busConfig.clientProxyPort = proxyPort;
      busConfig.hostServicePort = servicePort;
      exitCode = runHost(subprocessUtils, processRegistry, busConfig);
    } else if (mode == "access") {
      if (!result.count("url")) {
        CLOG(INFO, "stdout") << "Missing tunnel url" << endl;
        exit(1);
      }
      string binary = resolveTunnelBinary(cloudflaredOverride);
      if (binary.empty()) {
        CLOG(INFO, "stdout") << "cloudflared was not found. Install it or "
                                "pass its path with --cloudflared."
                             << endl;
        exit(1);
      }
      TunnelParams params;
      params.role = TunnelRole::Client;
      params.binaryPath = binary;
      params.tunnelUrl = normalizeTunnelUrl(trim(result["url"].as<string>()));
      params.localPort = proxyPort;
      exitCode = runAccess(subprocessUtils, processRegistry, params);
    } else if (mode == "probe") {
      exitCode = runProbe(proxyPort);
    } else if (mode == "connect") {
      LoginForm form;
      if (result.count("profile")) {
        ConnectionProfile saved =
            ConnectionProfile::load(result["profile"].as<string>());
        form.username = saved.username;
        form.width = to_string(saved.width);
        form.height = to_string(saved.height);
        proxyPort = saved.proxyPort;
      }
      if (result.count("url")) {
        form.tunnelUrl = result["url"].as<string>();
      }
      if (result.count("username")) {
        form.username = result["username"].as<string>();
      }
      if (result.count("width")) {
        form.width = result["width"].as<string>();
      }
      if (result.count("height")) {
        form.height = result["height"].as<string>();
      }
      if (result.count("password-stdin")) {
        getline(cin, form.password);
      }
      ClientConnectRequest request =
          buildClientConnectRequest(form, proxyPort);
      if (result.count("save-profile")) {
        request.profile.save(result["save-profile"].as<string>());
        CLOG(INFO, "stdout") << "Saved profile to "
                             << result["save-profile"].as<string>() << endl;
      }
      CLOG(INFO, "stdout") << "Connection to " << request.tunnelUrl << " as "
                           << request.profile.username << " via "
                           << request.profile.serverAddr() << " ("
                           << request.profile.width << "x"
                           << request.profile.height << ")" << endl;
      CLOG(INFO, "stdout")
          << "No remote desktop codec is available in this build. Run "
             "'tunneldesk access "
          << request.tunnelUrl << "' and point an external client at "
          << request.profile.serverAddr() << "." << endl;
      exitCode = 2;
    } else {
      CLOG(INFO, "stdout") << "Unknown mode: " << mode << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exitCode = 1;
    }
  } catch (ProfileValidationException& pve) {
    CLOG(INFO, "stdout") << "Invalid connection settings: " << pve.what()
                         << endl;
    exitCode = 1;
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  } catch (std::runtime_error& re) {
    LOG(ERROR) << "Fatal error: " << re.what();
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exitCode = 1;
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();

  return exitCode;
}
