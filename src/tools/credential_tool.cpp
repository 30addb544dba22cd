#include <boost/program_options.hpp>
#include <agentid/common/critical.hpp>
#include <agentid/crypto/canonical.hpp>
#include <agentid/crypto/signer.hpp>
#include <agentid/crypto/verify.hpp>
#include <agentid/schema/json.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

namespace {

namespace po = boost::program_options;

agentid::schema::json_t read_json(const po::variables_map& vm) {
  if (!vm.contains("input")) {
    agentid::common::critical("this command requires --input");
  }
  const auto& path = vm["input"].as<std::string>();
  auto text = std::string{};
  if (path == "-") {
    text.assign(std::istreambuf_iterator<char>{std::cin},
                std::istreambuf_iterator<char>{});
  } else {
    auto file = std::ifstream{path};
    if (!file) {
      agentid::common::critical("cannot open " + path);
    }
    text.assign(std::istreambuf_iterator<char>{file},
                std::istreambuf_iterator<char>{});
  }
  auto parsed = agentid::schema::json_t::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    agentid::common::critical("input is not valid JSON");
  }
  return parsed;
}

agentid::crypto::signer make_signer(const po::variables_map& vm) {
  const auto& variable = vm["secret-env"].as<std::string>();
  auto secret = agentid::crypto::master_secret::from_environment(variable);
  if (!secret) {
    agentid::common::critical(variable + " is not set");
  }
  return agentid::crypto::signer{std::move(*secret)};
}

std::string get_issuer_id(const po::variables_map& vm) {
  if (!vm.contains("issuer-id")) {
    agentid::common::critical("this command requires --issuer-id");
  }
  return vm["issuer-id"].as<std::string>();
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  credential_tool keygen --issuer-id ID\n"
            << "  credential_tool sign --issuer-id ID --input FILE\n"
            << "  credential_tool verify --public-key B64 --input FILE\n"
            << "  credential_tool canonicalize --input FILE\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"credential_tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "keygen|sign|verify|canonicalize")(
      "issuer-id", po::value<std::string>(), "issuer id keys derive from")(
      "input", po::value<std::string>(), "credential JSON file, - for stdin")(
      "public-key", po::value<std::string>(), "base64 Ed25519 public key")(
      "secret-env",
      po::value<std::string>()->default_value("AGENTID_SIGNING_KEY_SEED"),
      "environment variable holding the master secret");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (!agentid::crypto::available()) {
    agentid::common::critical("OpenSSL lacks Ed25519 support");
  }

  if (command == "keygen") {
    auto keys = make_signer(vm).generate_keys(get_issuer_id(vm));
    auto out = agentid::schema::json_t{{"public_key", keys.public_key},
                                       {"key_id", keys.key_id}};
    std::cout << out.dump(2) << '\n';
    return 0;
  }

  if (command == "sign") {
    auto payload = read_json(vm);
    if (!payload.is_object()) {
      agentid::common::critical("credential payload must be an object");
    }
    payload.erase("signature");
    payload["signature"] =
        make_signer(vm).sign_payload(payload, get_issuer_id(vm));
    std::cout << payload.dump() << '\n';
    return 0;
  }

  if (command == "verify") {
    if (!vm.contains("public-key")) {
      agentid::common::critical("verify requires --public-key");
    }
    auto payload = read_json(vm);
    auto signature = payload.is_object() && payload.contains("signature") &&
                             payload["signature"].is_string()
                         ? std::optional{payload["signature"].get<std::string>()}
                         : std::nullopt;
    auto message = agentid::crypto::canonical_signing_input(payload);
    auto valid = signature.has_value() &&
                 agentid::crypto::verify_ed25519(
                     agentid::schema::make_bytes_view(message),
                     vm["public-key"].as<std::string>(), *signature);
    std::cout << (valid ? "valid" : "invalid") << '\n';
    return valid ? 0 : 1;
  }

  if (command == "canonicalize") {
    std::cout << agentid::crypto::canonicalize(read_json(vm)) << '\n';
    return 0;
  }

  agentid::common::critical("command must be keygen|sign|verify|canonicalize");
}
