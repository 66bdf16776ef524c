#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <credo/blake3/hash.hpp>
#include <credo/execution/engine.hpp>
#include <credo/ledger/apply.hpp>
#include <credo/ledger/log_reader.hpp>
#include <credo/schema/event_type.hpp>
#include <credo/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace po = boost::program_options;

namespace {

using registry_engine_t =
    credo::execution::engine<credo::storage::rocksdb_storage_tag>;

struct options final {
  std::string command;
  std::string db_path;
  std::string log_level;
  std::string log_file;
  bool strict_crypto{true};
  std::string chain_id;
  std::string owner;
  uint64_t genesis_time{};
  std::string ledger;
  std::string path;
  std::string key;
  uint64_t from{};
  uint64_t to{};
};

void setup_logging(const options& opts) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto sinks = std::vector<spdlog::sink_ptr>{console_sink};
  if (!opts.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        opts.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "credo", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(opts.log_level));
}

std::optional<credo::schema::hash32_t> parse_hash(const std::string& name,
                                                  const std::string& hex) {
  auto hash = credo::schema::try_make_hash32(hex);
  if (!hash) {
    std::cerr << "--" << name << " must be 32 bytes of hex\n";
  }
  return hash;
}

void print_result(const credo::schema::transaction_result_t& result) {
  std::cout << "code=" << result.code << " codespace=" << result.codespace
            << " log=\"" << result.log << "\" info=\"" << result.info
            << "\"\n";
  for (const auto& event : result.events) {
    std::cout << "  event " << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << ' ' << attribute.key << '=' << attribute.value;
    }
    std::cout << '\n';
  }
}

void print_event(const credo::schema::event_record_t& event) {
  std::cout << event.event_id << ' ' << event.height << ':' << event.tx_index
            << ' ' << credo::schema::to_string(event.type) << ' '
            << credo::schema::to_hex(event.principal);
  for (const auto& attribute : event.attributes) {
    std::cout << ' ' << attribute.key << '=' << attribute.value;
  }
  std::cout << '\n';
}

void print_identity(const credo::schema::identity_record_t& identity) {
  std::cout << "name=" << identity.name << " email=" << identity.email
            << " profile_hash=" << identity.profile_hash
            << " reputation=" << identity.reputation_score
            << " verified=" << (identity.is_verified ? "true" : "false")
            << " created_at=" << identity.created_at
            << " last_updated=" << identity.last_updated << '\n';
}

void print_credential(const credo::schema::credential_record_t& credential) {
  std::cout << "type=" << credential.credential_type
            << " issuer=" << credential.issuer
            << " issuer_principal="
            << credo::schema::to_hex(credential.issuer_principal)
            << " hash=" << credential.credential_hash
            << " issued_at=" << credential.issued_at
            << " expires_at=" << credential.expires_at
            << " valid=" << (credential.is_valid ? "true" : "false") << '\n';
}

/// Render a successful query value for the routes with a fixed shape.
void print_query_value(const std::string& path,
                       const credo::schema::bytes_t& value) {
  auto encoder = credo::execution::scale_encoder_t{};
  auto bytes = credo::schema::bytes_view_t{value.data(), value.size()};
  if (path == "/engine/info") {
    auto decoded = encoder.try_decode<
        std::tuple<int64_t, credo::schema::hash32_t, credo::schema::hash32_t>>(
        bytes);
    if (decoded) {
      std::cout << "height=" << std::get<0>(*decoded)
                << " state_root=" << credo::schema::to_hex(std::get<1>(*decoded))
                << " chain_id=" << credo::schema::to_hex(std::get<2>(*decoded))
                << '\n';
      return;
    }
  } else if (path == "/registry/stats") {
    if (auto stats = encoder.try_decode<credo::schema::registry_stats_t>(bytes)) {
      std::cout << "total_identities=" << stats->total_identities << '\n';
      return;
    }
  } else if (path == "/registry/owner") {
    if (auto owner = encoder.try_decode<credo::schema::principal_t>(bytes)) {
      std::cout << credo::schema::to_hex(*owner) << '\n';
      return;
    }
  } else if (path == "/state/identity") {
    if (auto identity =
            encoder.try_decode<credo::schema::identity_record_t>(bytes)) {
      print_identity(*identity);
      return;
    }
  } else if (path == "/state/credential") {
    if (auto credential =
            encoder.try_decode<credo::schema::credential_record_t>(bytes)) {
      print_credential(*credential);
      return;
    }
  } else if (path == "/state/trusted_issuer" ||
             path == "/state/credential_valid") {
    if (auto flag = encoder.try_decode<bool>(bytes)) {
      std::cout << (*flag ? "true" : "false") << '\n';
      return;
    }
  } else if (path == "/state/credentials_count") {
    if (auto count = encoder.try_decode<uint64_t>(bytes)) {
      std::cout << *count << '\n';
      return;
    }
  } else if (path == "/events/range") {
    if (auto events =
            encoder.try_decode<std::vector<credo::schema::event_record_t>>(
                bytes)) {
      for (const auto& event : *events) {
        print_event(event);
      }
      return;
    }
  }
  std::cout << credo::schema::to_base64(value) << '\n';
}

int run_init(registry_engine_t& engine, const options& opts) {
  if (opts.owner.empty()) {
    std::cerr << "init requires --owner\n";
    return 2;
  }
  auto owner = parse_hash("owner", opts.owner);
  if (!owner) {
    return 2;
  }
  auto chain_id = std::optional<credo::schema::hash32_t>{
      credo::blake3::hash(credo::schema::kDefaultChainIdSeed)};
  if (!opts.chain_id.empty()) {
    chain_id = parse_hash("chain-id", opts.chain_id);
    if (!chain_id) {
      return 2;
    }
  }
  auto result = engine.initialize(credo::schema::genesis_t{
      .chain_id = *chain_id,
      .owner = *owner,
      .genesis_time = opts.genesis_time});
  print_result(result);
  return result.code == 0 ? 0 : 1;
}

int run_apply(registry_engine_t& engine, const options& opts) {
  if (opts.ledger.empty()) {
    std::cerr << "apply requires --ledger\n";
    return 2;
  }
  auto error = std::string{};
  auto blocks = credo::ledger::load_ledger(opts.ledger, error);
  if (!blocks) {
    spdlog::error("Failed to load ledger {}: {}", opts.ledger, error);
    return 1;
  }
  auto summary = credo::ledger::apply_blocks(engine, *blocks);
  std::cout << "applied=" << summary.blocks_applied
            << " skipped=" << summary.blocks_skipped
            << " rejected=" << summary.blocks_rejected
            << " succeeded=" << summary.tx_succeeded
            << " failed=" << summary.tx_failed
            << " height=" << summary.committed_height
            << " state_root=" << credo::schema::to_hex(summary.state_root)
            << '\n';
  return summary.blocks_rejected == 0 ? 0 : 1;
}

int run_query(const registry_engine_t& engine, const options& opts) {
  if (opts.path.empty()) {
    std::cerr << "query requires --path\n";
    return 2;
  }
  auto key = credo::schema::try_from_base64(opts.key);
  if (!key) {
    std::cerr << "--key must be base64\n";
    return 2;
  }
  auto result = engine.query(
      opts.path, credo::schema::bytes_view_t{key->data(), key->size()});
  if (result.code != 0) {
    std::cout << "code=" << result.code << " codespace=" << result.codespace
              << " log=\"" << result.log << "\"\n";
    return 1;
  }
  print_query_value(opts.path, result.value);
  return 0;
}

int run_info(const registry_engine_t& engine) {
  auto info = engine.info();
  std::cout << info.data << ' ' << info.version
            << " height=" << info.last_block_height
            << " block_time=" << info.last_block_time << " state_root="
            << credo::schema::to_hex(info.last_block_state_root) << '\n';
  if (auto genesis = engine.genesis()) {
    std::cout << "chain_id=" << credo::schema::to_hex(genesis->chain_id)
              << " owner=" << credo::schema::to_hex(genesis->owner) << '\n';
  } else {
    std::cout << "registry not initialized\n";
  }
  return 0;
}

int run_replay(const registry_engine_t& engine) {
  auto result = engine.replay_history();
  std::cout << "ok=" << (result.ok ? "true" : "false")
            << " tx_count=" << result.tx_count
            << " applied=" << result.applied_count
            << " last_height=" << result.last_height
            << " state_root=" << credo::schema::to_hex(result.state_root);
  if (!result.error.empty()) {
    std::cout << " error=\"" << result.error << '"';
  }
  std::cout << '\n';
  return result.ok ? 0 : 1;
}

int run_events(const registry_engine_t& engine, const options& opts) {
  for (const auto& event : engine.events(opts.from, opts.to)) {
    print_event(event);
  }
  return 0;
}

int run_history(const registry_engine_t& engine, const options& opts) {
  for (const auto& entry : engine.history(opts.from, opts.to)) {
    std::cout << entry.height << ':' << entry.index << " code=" << entry.code
              << ' '
              << credo::ledger::format_ledger_line(entry.height,
                                                   entry.block_time, entry.tx)
              << '\n';
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = options{};
  auto config_path = std::string{};

  auto description = po::options_description{"Credo"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&opts.command),
      "init|apply|query|info|replay|events|history")(
      "config,c", po::value<std::string>(&config_path),
      "INI config file; command line values take precedence")(
      "db-path,d",
      po::value<std::string>(&opts.db_path)->default_value("credo.db"),
      "RocksDB directory")(
      "log-level",
      po::value<std::string>(&opts.log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(&opts.log_file)->default_value(""),
      "Also log to this file")(
      "strict-crypto",
      po::value<bool>(&opts.strict_crypto)->default_value(true),
      "Verify Ed25519 transaction signatures")(
      "chain-id", po::value<std::string>(&opts.chain_id)->default_value(""),
      "init: chain id hex (default: BLAKE3 of the default seed)")(
      "owner", po::value<std::string>(&opts.owner)->default_value(""),
      "init: owner principal hex")(
      "genesis-time",
      po::value<uint64_t>(&opts.genesis_time)->default_value(0),
      "init: genesis time in ms")(
      "ledger", po::value<std::string>(&opts.ledger)->default_value(""),
      "apply: ledger log file")(
      "path", po::value<std::string>(&opts.path)->default_value(""),
      "query: route")("key",
                      po::value<std::string>(&opts.key)->default_value(""),
                      "query: base64 key bytes")(
      "from", po::value<uint64_t>(&opts.from)->default_value(1),
      "events/history: range start")(
      "to",
      po::value<uint64_t>(&opts.to)->default_value(
          std::numeric_limits<uint64_t>::max()),
      "events/history: range end");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto config_file = vm["config"].as<std::string>();
      auto config = std::ifstream{config_file};
      if (!config) {
        std::cerr << "cannot open config file " << config_file << '\n';
        return 2;
      }
      po::store(po::parse_config_file(config, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n' << description << std::endl;
    return 2;
  }

  if (vm.contains("help") || opts.command.empty()) {
    std::cout << description << std::endl;
    return 0;
  }

  setup_logging(opts);

  auto encoder = credo::execution::scale_encoder_t{};
  auto storage = credo::storage::make_storage<credo::storage::rocksdb_storage_tag>(
      opts.db_path);
  auto engine = registry_engine_t{encoder, storage, opts.strict_crypto};

  auto code = 2;
  if (opts.command == "init") {
    code = run_init(engine, opts);
  } else if (opts.command == "apply") {
    code = run_apply(engine, opts);
  } else if (opts.command == "query") {
    code = run_query(engine, opts);
  } else if (opts.command == "info") {
    code = run_info(engine);
  } else if (opts.command == "replay") {
    code = run_replay(engine);
  } else if (opts.command == "events") {
    code = run_events(engine, opts);
  } else if (opts.command == "history") {
    code = run_history(engine, opts);
  } else {
    std::cerr << "unknown command " << opts.command << '\n';
  }

  spdlog::shutdown();
  return code;
}
