#include <boost/program_options.hpp>
#include <reina/blake3/hash.hpp>
#include <reina/framing/batch.hpp>
#include <reina/framing/envelope.hpp>
#include <reina/framing/ultra.hpp>
#include <reina/schema/block.hpp>
#include <reina/schema/transfer.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;
namespace wire = reina::schema::encoding::wire;

constexpr auto kUsageExitCode = 2;

/// Bad flags or flag values. Reported by main with kUsageExitCode; codec
/// failures on well-formed requests exit 1 instead.
struct usage_error final : std::runtime_error {
  using std::runtime_error::runtime_error;
};

reina::schema::bytes_t decode_hex_bytes(const std::string_view hex) {
  auto bytes = reina::schema::try_from_hex(hex);
  if (!bytes) {
    throw usage_error("expected an even-length hex string");
  }
  return *bytes;
}

wire::endianness get_endianness(const po::variables_map& vm) {
  auto order = wire::try_parse_endianness(vm["endian"].as<std::string>());
  if (!order) {
    throw usage_error("endian must be little|big");
  }
  return *order;
}

reina::schema::transfer_t build_transfer(const po::variables_map& vm) {
  auto version = vm["version"].as<uint32_t>();
  if (version > UINT8_MAX) {
    throw usage_error("version must fit in one byte");
  }
  return reina::schema::transfer_t{
      .id = vm["id"].as<uint64_t>(),
      .amount = vm["amount"].as<uint64_t>(),
      .fee = vm["fee"].as<double>(),
      .version = static_cast<uint8_t>(version),
      .sender = vm["sender"].as<std::string>(),
      .recipient = vm["recipient"].as<std::string>(),
      .signature = vm["signature-hex"].as<std::string>().empty()
                       ? reina::schema::bytes_t{}
                       : decode_hex_bytes(
                             vm["signature-hex"].as<std::string>())};
}

std::vector<reina::schema::transfer_t> build_transfers(
    const po::variables_map& vm) {
  return std::vector<reina::schema::transfer_t>(vm["count"].as<std::size_t>(),
                                                build_transfer(vm));
}

reina::schema::block_t build_block(const po::variables_map& vm) {
  return reina::schema::block_t{
      .version = 1,
      .number = vm["number"].as<uint64_t>(),
      .previous_hash = decode_hex_bytes(vm["previous-hash"].as<std::string>()),
      .transactions = build_transfers(vm)};
}

void print_transfer(const reina::schema::transfer_t& tx) {
  std::cout << "transfer id=" << tx.id << " amount=" << tx.amount
            << " fee=" << tx.fee << " version=" << static_cast<int>(tx.version)
            << " sender=" << tx.sender << " recipient=" << tx.recipient
            << " signature="
            << reina::schema::to_hex(reina::schema::make_bytes_view(
                   tx.signature))
            << '\n';
}

void print_block(const reina::schema::block_t& block) {
  std::cout << "block version=" << static_cast<int>(block.version)
            << " number=" << block.number << " previous_hash="
            << reina::schema::to_hex(reina::schema::make_bytes_view(
                   block.previous_hash))
            << " transactions=" << block.transactions.size() << '\n';
  for (const auto& tx : block.transactions) {
    print_transfer(tx);
  }
}

template <typename Frame>
int print_frame(const Frame& frame) {
  if (!frame) {
    std::cerr << "error: " << wire::to_string(frame.error()) << '\n';
    return 1;
  }
  std::cout << reina::schema::to_hex(frame.value()) << '\n';
  return 0;
}

int report(const wire::codec_error_t& error) {
  spdlog::debug("decode failed with {}", wire::kind_name(error));
  std::cerr << "error: " << wire::to_string(error) << '\n';
  return 1;
}

int decode(const po::variables_map& vm, const wire::endianness order) {
  if (!vm.contains("hex")) {
    throw usage_error("decode mode requires --hex");
  }
  const auto bytes = decode_hex_bytes(vm["hex"].as<std::string>());
  const auto frame = vm["frame"].as<std::string>();
  const auto kind = vm["kind"].as<std::string>();
  if (frame == "ultra") {
    auto tx = reina::framing::deserialize_ultra_fixed(
        reina::schema::make_bytes_view(bytes), order);
    if (!tx) {
      return report(tx.error());
    }
    print_transfer(tx.value());
    return 0;
  }
  if (frame == "batch") {
    auto items = reina::framing::deserialize_batch<reina::schema::transfer_t>(
        bytes, order);
    if (!items) {
      return report(items.error());
    }
    for (const auto& tx : items.value()) {
      print_transfer(tx);
    }
    return 0;
  }
  if (frame != "general") {
    throw usage_error("frame must be general|ultra|batch");
  }
  if (kind == "block") {
    auto block =
        reina::framing::deserialize<reina::schema::block_t>(bytes, order);
    if (!block) {
      return report(block.error());
    }
    print_block(block.value());
    return 0;
  }
  if (kind != "transfer") {
    throw usage_error("kind must be transfer|block");
  }
  auto tx =
      reina::framing::deserialize<reina::schema::transfer_t>(bytes, order);
  if (!tx) {
    return report(tx.error());
  }
  print_transfer(tx.value());
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  reina_frame_tool transfer [options]\n"
            << "  reina_frame_tool block [options]\n"
            << "  reina_frame_tool batch [options]\n"
            << "  reina_frame_tool decode --hex <frame> [options]\n"
            << "  reina_frame_tool hash --hex <bytes>\n\n";
  std::cout << options << '\n';
}

void configure_logging(const bool verbose) {
  auto logger = spdlog::stderr_color_mt("reina_frame_tool");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

int run(const std::string& command, const po::variables_map& vm) {
  const auto order = get_endianness(vm);

  if (command == "transfer") {
    const auto tx = build_transfer(vm);
    const auto frame = vm["frame"].as<std::string>();
    if (frame == "ultra") {
      return print_frame(reina::framing::serialize_ultra_fixed(tx, order));
    }
    if (frame != "general") {
      throw usage_error("transfer frame must be general|ultra");
    }
    return print_frame(reina::framing::serialize(tx, order));
  }

  if (command == "block") {
    return print_frame(reina::framing::serialize(build_block(vm), order));
  }

  if (command == "batch") {
    return print_frame(
        reina::framing::serialize_batch(build_transfers(vm), order));
  }

  if (command == "decode") {
    return decode(vm, order);
  }

  if (command == "hash") {
    if (!vm.contains("hex")) {
      throw usage_error("hash mode requires --hex");
    }
    const auto bytes = decode_hex_bytes(vm["hex"].as<std::string>());
    const auto digest =
        reina::blake3::hash(reina::schema::make_bytes_view(bytes));
    std::cout << reina::schema::to_hex(digest) << '\n';
    return 0;
  }

  throw usage_error("command must be transfer|block|batch|decode|hash");
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"reina_frame_tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transfer|block|batch|decode|hash")(
      "endian", po::value<std::string>()->default_value("little"),
      "little|big")("frame", po::value<std::string>()->default_value("general"),
                    "general|ultra|batch")(
      "kind", po::value<std::string>()->default_value("transfer"),
      "transfer|block")("id", po::value<uint64_t>()->default_value(0),
                        "transfer id")(
      "amount", po::value<uint64_t>()->default_value(0), "transfer amount")(
      "fee", po::value<double>()->default_value(0.0), "transfer fee")(
      "version", po::value<uint32_t>()->default_value(1), "schema version")(
      "sender", po::value<std::string>()->default_value(""), "sender text")(
      "recipient", po::value<std::string>()->default_value(""),
      "recipient text")("signature-hex",
                        po::value<std::string>()->default_value(""),
                        "signature bytes hex")(
      "count", po::value<std::size_t>()->default_value(1),
      "copies of the transfer in a block or batch")(
      "number", po::value<uint64_t>()->default_value(0), "block number")(
      "previous-hash", po::value<std::string>()->default_value(""),
      "previous block hash hex")("hex", po::value<std::string>(),
                                 "input bytes hex for decode|hash")(
      "verbose,v", "enable debug logging");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << "error: " << e.what() << '\n';
    print_help(options);
    return kUsageExitCode;
  }

  configure_logging(vm.contains("verbose"));

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  try {
    return run(command, vm);
  } catch (const usage_error& e) {
    std::cerr << "error: " << e.what() << '\n';
    return kUsageExitCode;
  }
}
