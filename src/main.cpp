#include "ApiClient.hpp"
#include "Cancellation.hpp"
#include "Config.hpp"
#include "ProgressReporter.hpp"
#include "SyncCommands.hpp"
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef _WIN32
#include <termios.h>
#include <unistd.h>
#endif

namespace {

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

const char *kUsage =
    "usage: openneuro-cli <command> [options]\n"
    "\n"
    "commands:\n"
    "  login [--server URL]                          store an access token\n"
    "  upload [--delete] [--force] [DATASET] [PATH]  push PATH to DATASET\n"
    "  download [--delete] [--version V] DATASET [PATH]\n"
    "                                                fetch DATASET into PATH\n"
    "  publish DATASET                               publish a dataset\n"
    "\n"
    "environment: OPENNEURO_SERVER, OPENNEURO_TOKEN, OPENNEURO_CONFIG\n";

struct ParsedArgs {
  std::set<std::string> flags;
  std::map<std::string, std::string> values;
  std::vector<std::string> positional;
};

ParsedArgs parseArgs(const std::vector<std::string> &args,
                     const std::set<std::string> &flags,
                     const std::set<std::string> &valued) {
  ParsedArgs parsed;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg.rfind("--", 0) != 0 || arg == "--") {
      parsed.positional.push_back(arg);
      continue;
    }
    std::string name = arg;
    std::optional<std::string> value;
    auto eq = arg.find('=');
    if (eq != std::string::npos) {
      name = arg.substr(0, eq);
      value = arg.substr(eq + 1);
    }
    if (flags.count(name) && !value) {
      parsed.flags.insert(name);
    } else if (valued.count(name)) {
      if (!value) {
        if (i + 1 >= args.size())
          throw UsageError(name + " needs a value");
        value = args[++i];
      }
      parsed.values[name] = *value;
    } else {
      throw UsageError("unknown option " + arg);
    }
  }
  return parsed;
}

std::string readSecret(const std::string &prompt) {
  std::cout << prompt << std::flush;
  std::string secret;
#ifndef _WIN32
  termios original{};
  bool restore = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &original) == 0;
  if (restore) {
    termios silent = original;
    silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    tcsetattr(STDIN_FILENO, TCSANOW, &silent);
  }
  std::getline(std::cin, secret);
  if (restore) {
    tcsetattr(STDIN_FILENO, TCSANOW, &original);
    std::cout << std::endl;
  }
#else
  std::getline(std::cin, secret);
#endif
  return secret;
}

int runCommand(const std::string &command, const std::vector<std::string> &rest,
               neurosync::CancellationToken &cancel) {
  neurosync::ProcessEnvironment env;
  neurosync::CredentialStore store(neurosync::defaultCredentialPath(env));

  if (command == "login") {
    auto args = parseArgs(rest, {}, {"--server"});
    if (!args.positional.empty())
      throw UsageError("login takes no positional arguments");
    std::string server;
    if (args.values.count("--server"))
      server = args.values["--server"];
    else
      server = neurosync::resolveConfig(env, store).server;
    std::string token = readSecret("Access token for " + server + ": ");
    neurosync::saveLogin(store, server, token);
    return neurosync::kExitOk;
  }

  neurosync::ClientConfig config = neurosync::resolveConfig(env, store);
  neurosync::ApiClient client(config, &cancel);
  neurosync::ConsoleProgress progress;
  neurosync::SyncCommands commands(client, cancel, &progress);

  if (command == "upload") {
    auto args = parseArgs(rest, {"--delete", "--force"}, {});
    if (args.positional.size() > 2)
      throw UsageError("upload takes at most DATASET and PATH");
    neurosync::UploadOptions options;
    options.deleteOrphans = args.flags.count("--delete") > 0;
    options.force = args.flags.count("--force") > 0;
    if (!args.positional.empty())
      options.datasetId = args.positional[0];
    if (args.positional.size() > 1)
      options.path = args.positional[1];
    return commands.upload(options);
  }

  if (command == "download") {
    auto args = parseArgs(rest, {"--delete"}, {"--version"});
    if (args.positional.empty() || args.positional.size() > 2)
      throw UsageError("download needs DATASET and an optional PATH");
    neurosync::DownloadOptions options;
    options.datasetId = args.positional[0];
    options.deleteOrphans = args.flags.count("--delete") > 0;
    if (args.values.count("--version"))
      options.version = args.values["--version"];
    if (args.positional.size() > 1)
      options.path = args.positional[1];
    return commands.download(options);
  }

  if (command == "publish") {
    auto args = parseArgs(rest, {}, {});
    if (args.positional.size() != 1)
      throw UsageError("publish needs exactly one DATASET");
    return commands.publish(args.positional[0]);
  }

  throw UsageError("unknown command '" + command + "'");
}

} // namespace

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty()) {
    std::cerr << kUsage;
    return neurosync::kExitFatal;
  }
  if (args[0] == "-h" || args[0] == "--help" || args[0] == "help") {
    std::cout << kUsage;
    return neurosync::kExitOk;
  }

  neurosync::CancellationToken cancel;
  neurosync::installSignalHandlers(cancel);

  try {
    std::vector<std::string> rest(args.begin() + 1, args.end());
    return runCommand(args[0], rest, cancel);
  } catch (const UsageError &e) {
    std::cerr << "openneuro-cli: " << e.what() << "\n\n" << kUsage;
    return neurosync::kExitFatal;
  } catch (const neurosync::AuthError &e) {
    std::cerr << "[Main] Authentication error: " << e.what() << std::endl;
    return neurosync::kExitFatal;
  } catch (const std::exception &e) {
    if (cancel.cancelled()) {
      std::cerr << "[Main] Interrupted" << std::endl;
      return neurosync::kExitInterrupted;
    }
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return neurosync::kExitFatal;
  }
}
