#include <cxxopts.hpp>

#include "ClientConfig.hpp"
#include "Headers.hpp"
#include "HttplibTransport.hpp"
#include "LogHandler.hpp"
#include "NetCastClient.hpp"

using namespace lgnc;

namespace {
// Status categories printed when no command is given
const vector<pair<string, string>> STATUS_QUERIES = {
    {"Channel Info", QUERY_CUR_CHANNEL},
    {"Volume Info", QUERY_VOLUME_INFO},
    {"Context Info", QUERY_CONTEXT_UI},
    {"Is 3D", QUERY_3D},
};

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

int parseCommandArg(const string& arg) {
  if (isAllDigits(arg)) {
    if (arg.length() > 9) {
      throw ConfigException("Command code out of range: " + arg);
    }
    return stoi(arg);
  }
  auto code = remoteCommandFromName(arg);
  if (!code) {
    throw ConfigException("Unknown command: " + arg +
                          " (see --list-commands)");
  }
  return *code;
}

// Accepts "7", "7-1" or "7.1"
pair<int, int> parseChannelArg(const string& arg) {
  string normalized = arg;
  std::replace(normalized.begin(), normalized.end(), '.', '-');
  auto tokens = split(normalized, '-');
  if (tokens.empty() || tokens.size() > 2) {
    throw ConfigException("Invalid channel: " + arg);
  }
  for (const auto& token : tokens) {
    if (!isAllDigits(token) || token.length() > 6) {
      throw ConfigException("Invalid channel: " + arg);
    }
  }
  int major = stoi(tokens[0]);
  int minor = tokens.size() == 2 ? stoi(tokens[1]) : -1;
  return make_pair(major, minor);
}

void printStatus(NetCastClient* client) {
  for (const auto& it : STATUS_QUERIES) {
    try {
      auto data = client->queryData(it.second);
      if (!data.empty()) {
        CLOG(INFO, "stdout") << it.first << ": " << data[0].str() << endl;
      } else {
        CLOG(INFO, "stdout") << it.first << ": (no data)" << endl;
      }
    } catch (const ProtocolError& pe) {
      CLOG(INFO, "stdout") << "Can not retrieve " << toLower(it.first)
                           << " - error: " << pe.what() << endl;
    } catch (const ParseError& pe) {
      CLOG(INFO, "stdout") << "Can not retrieve " << toLower(it.first)
                           << " - error: " << pe.what() << endl;
    }
  }
}

int runClient(const ClientConfig& config, const optional<string>& pairingKey,
              const optional<int>& command,
              const optional<pair<int, int>>& channel,
              const string& screenshotPath) {
  HttpEndpoint endpoint = config.endpoint();
  shared_ptr<HttpTransport> transport(
      new HttplibTransport(endpoint, config.timeoutMs));
  try {
    NetCastClient client(transport, endpoint, pairingKey);
    if (!client.open()) {
      CLOG(INFO, "stdout")
          << "Pairing key is displayed on the TV - use it for the "
             "--pairing_key parameter to connect to your TV."
          << endl;
      return 0;
    }

    if (command) {
      client.sendCommand(*command);
      CLOG(INFO, "stdout") << "Sent command " << *command << endl;
    } else if (channel) {
      auto found = client.findChannel(channel->first, channel->second);
      if (!found) {
        CLOG(INFO, "stdout") << "Channel " << channel->first
                             << (channel->second >= 0
                                     ? "-" + to_string(channel->second)
                                     : string())
                             << " is not in the channel list" << endl;
        return 1;
      }
      client.changeChannel(*found);
      CLOG(INFO, "stdout") << "Changed channel to "
                           << found->childText("chname") << endl;
    } else if (!screenshotPath.empty()) {
      string image = client.captureScreen();
      ofstream out(screenshotPath, ios::out | ios::binary | ios::trunc);
      out.write(image.data(), image.size());
      out.close();
      if (!out) {
        CLOG(INFO, "stdout") << "Could not write " << screenshotPath << endl;
        return 1;
      }
      CLOG(INFO, "stdout") << "Saved " << image.size() << " bytes to "
                           << screenshotPath << endl;
    } else {
      printStatus(&client);
    }
    client.close();
  } catch (const ConnectionError& ce) {
    STERROR << ce.what();
    CLOG(INFO, "stdout") << "Could not connect to the TV"
                         << (ce.isTimeout() ? " (timed out)" : "") << ": "
                         << ce.what() << endl;
    return 1;
  } catch (const AuthenticationError& ae) {
    STERROR << ae.what();
    CLOG(INFO, "stdout")
        << "The TV rejected the pairing key: " << ae.what()
        << "\nRun without --pairing_key to display a new key on the TV."
        << endl;
    return 1;
  } catch (const SessionError& se) {
    STERROR << se.what();
    CLOG(INFO, "stdout") << "No session with the TV: " << se.what() << endl;
    return 1;
  } catch (const ProtocolError& pe) {
    STERROR << pe.what();
    CLOG(INFO, "stdout") << "The TV sent an unexpected response: "
                         << pe.what() << endl;
    return 1;
  } catch (const ParseError& pe) {
    STERROR << pe.what();
    CLOG(INFO, "stdout") << "The TV sent malformed XML: " << pe.what()
                         << endl;
    return 1;
  }
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  lgnc::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, lgnc::InterruptSignalHandler);

  int exitCode = 0;
  cxxopts::Options options("lgnetcast", "Remote control for a LG NetCast TV");
  try {
    options.positional_help("[host]");
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("host", "Address of the TV",
         cxxopts::value<std::string>())  //
        ("pairing_key",
         "Pairing key to access the TV. Leave out to display the key on the "
         "TV",
         cxxopts::value<std::string>())  //
        ("command",
         "Remote control command to send to the TV, as a number or a name "
         "like volume_up",
         cxxopts::value<std::string>())  //
        ("channel", "Change to channel MAJOR[-MINOR]",
         cxxopts::value<std::string>())  //
        ("screenshot", "Save a capture of the screen to this file",
         cxxopts::value<std::string>())                           //
        ("list-commands", "Print the known remote control commands")  //
        ("p,port", "Port of the TV's remote control service",
         cxxopts::value<int>())  //
        ("protocol", "LG TV protocol hdcp (NetCast 3) or roap (NetCast 4)",
         cxxopts::value<std::string>())  //
        ("t,timeout", "Milliseconds to wait for the TV",
         cxxopts::value<int>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>())  //
        ("v,verbose", "Enable verbose logging", cxxopts::value<int>(),
         "LEVEL")                                //
        ("logtostdout", "Write log to stdout")  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>())  //
        ;

    options.parse_positional({"host"});
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "lgnetcast version " << LGNC_VERSION << endl;
      exit(0);
    }
    if (result.count("list-commands")) {
      for (const auto& it : allRemoteCommands()) {
        CLOG(INFO, "stdout") << it.code << "\t" << it.name << endl;
      }
      exit(0);
    }

    ClientConfig config;
    config.logDirectory = GetTempDirectory();
    string cfgfile = result.count("cfgfile") ? result["cfgfile"].as<string>()
                                             : ClientConfig::defaultConfigPath();
    if (result.count("cfgfile") || fs::exists(cfgfile)) {
      config.loadFile(cfgfile);
    }

    // Command line beats the config file
    if (result.count("host")) {
      config.host = result["host"].as<string>();
    }
    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("protocol")) {
      config.protocol = toLower(result["protocol"].as<string>());
    }
    if (result.count("timeout")) {
      config.timeoutMs = result["timeout"].as<int>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("logdir")) {
      config.logDirectory = result["logdir"].as<string>();
    }
    config.validate();

    el::Loggers::setVerboseLevel(config.verbose);
    LogHandler::setupLogFiles(&defaultConf, config.logDirectory, "lgnetcast",
                              result.count("logtostdout") > 0);
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("main");

    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    optional<string> pairingKey;
    if (result.count("pairing_key")) {
      pairingKey = result["pairing_key"].as<string>();
    }
    optional<int> command;
    if (result.count("command")) {
      command = parseCommandArg(result["command"].as<string>());
    }
    optional<pair<int, int>> channel;
    if (result.count("channel")) {
      channel = parseChannelArg(result["channel"].as<string>());
    }
    string screenshotPath;
    if (result.count("screenshot")) {
      screenshotPath = result["screenshot"].as<string>();
    }

    LOG(INFO) << "Connecting to " << config.endpoint() << " (timeout "
              << config.timeoutMs << "ms)";
    exitCode =
        runClient(config, pairingKey, command, channel, screenshotPath);
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  } catch (ConfigException& ce) {
    handleParseException(ce, options);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();

  return exitCode;
}
