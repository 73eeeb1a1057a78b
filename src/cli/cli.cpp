#include "cli/cli.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>
#include "crypto/cipher.hpp"
#include "crypto/crypto_error.hpp"
#include "lock/lock_manager.hpp"

namespace vault {
namespace cli {

namespace {

// Splits "a/b" into segments, an empty string is the root
std::vector<std::string> split_prefix(const std::string& text) {
  std::vector<std::string> segments;
  std::string segment;
  std::istringstream stream(text);
  while (std::getline(stream, segment, '/')) {
    if (!segment.empty()) {
      segments.push_back(segment);
    }
  }
  return segments;
}

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t");
  return text.substr(first, last - first + 1);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::Store& store, std::istream& in, std::ostream& out)
  : store_(store)
  , in_(in)
  , out_(out)
  , running_(false) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "vault> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "vault> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  iss >> command;
  if (command.empty()) {
    return true;
  }
  if (command == "quit" || command == "exit") {
    return false;
  }

  std::string args;
  std::getline(iss, args);
  process_command(command, trim(args));
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with args: " << args;

  if (command == "get" && !args.empty()) {
    handle_get_command(args);
  }
  else if (command == "put" && !args.empty()) {
    handle_put_command(args);
  }
  else if (command == "rm" && !args.empty()) {
    handle_remove_command(args);
  }
  else if (command == "ls") {
    handle_list_command(args);
  }
  else if (command == "migrate" && args.empty()) {
    handle_migrate_command();
  }
  else if (command == "locks" && args.empty()) {
    handle_locks_command();
  }
  else if (command == "keygen" && args.empty()) {
    handle_keygen_command();
  }
  else if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else {
    out_ << "Unknown command or invalid arguments, type 'help'" << std::endl;
  }
}

void CLI::handle_get_command(const std::string& key) {
  try {
    auto record = store_.read(store::StorageKey::parse(key));
    if (!record) {
      out_ << "Not found: " << key << std::endl;
      return;
    }
    out_ << record->dump(2) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading record", e.what());
  }
}

void CLI::handle_put_command(const std::string& args) {
  const auto space = args.find_first_of(" \t");
  if (space == std::string::npos) {
    out_ << "Usage: put <key> <json>" << std::endl;
    return;
  }

  const std::string key = args.substr(0, space);
  const std::string text = trim(args.substr(space));
  try {
    auto record = nlohmann::json::parse(text);
    store_.write(store::StorageKey::parse(key), record);
    out_ << "Stored " << key << std::endl;
  } catch (const nlohmann::json::parse_error& e) {
    log_and_display_error("Invalid JSON", e.what());
  } catch (const std::exception& e) {
    log_and_display_error("Error writing record", e.what());
  }
}

void CLI::handle_remove_command(const std::string& key) {
  try {
    bool removed = store_.remove(store::StorageKey::parse(key));
    out_ << (removed ? "Removed " : "Nothing to remove at ") << key << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error removing record", e.what());
  }
}

void CLI::handle_list_command(const std::string& prefix) {
  try {
    std::size_t count = 0;
    for (const auto& key : store_.keys(split_prefix(prefix))) {
      out_ << "  " << key << std::endl;
      ++count;
    }
    out_ << count << (count == 1 ? " record" : " records") << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error listing records", e.what());
  }
}

void CLI::handle_migrate_command() {
  try {
    std::size_t migrated = store_.migrate_to_encrypted();
    out_ << "Encrypted " << migrated << " records" << std::endl;
  } catch (const crypto::KeyUnavailableError& e) {
    log_and_display_error("Migration unavailable", e.what());
  } catch (const std::exception& e) {
    log_and_display_error("Migration failed", e.what());
  }
}

void CLI::handle_locks_command() {
  auto table = store_.lock_manager().diagnostics();
  if (table.empty()) {
    out_ << "No locks held" << std::endl;
    return;
  }

  for (const auto& [resource, info] : table) {
    out_ << resource << std::endl
         << "    " << (info.exclusive ? "exclusive" : std::to_string(info.shared_holders) + " shared")
         << ", waiting " << info.waiting_shared << " shared / " << info.waiting_exclusive << " exclusive";
    if (info.held_for) {
      out_ << ", held " << info.held_for->count() << " ms";
    }
    out_ << std::endl;
  }
}

void CLI::handle_keygen_command() {
  try {
    out_ << crypto::AesGcmCipher::generate_key() << std::endl;
    out_ << "Export it as " << config::ENCRYPTION_KEY_ENV << " before starting vault" << std::endl;
  } catch (const crypto::CryptoError& e) {
    log_and_display_error("Error generating key", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help              Display this help message" << std::endl;
  out_ << "  get <key>         Print the record at <key> (a/b/c)" << std::endl;
  out_ << "  put <key> <json>  Write <json> at <key>" << std::endl;
  out_ << "  rm <key>          Remove the record at <key>" << std::endl;
  out_ << "  ls [prefix]       List keys, optionally below <prefix>" << std::endl;
  out_ << "  migrate           Encrypt every plaintext record" << std::endl;
  out_ << "  locks             Show the lock table" << std::endl;
  out_ << "  keygen            Generate a new master key" << std::endl;
  out_ << "  quit              Exit the shell" << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace vault
