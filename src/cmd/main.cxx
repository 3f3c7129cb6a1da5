#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "code/code.hpp"
#include "pkg/mceliece.hpp"
#include "util/bitstring.hpp"
#include "util/defines.hpp"
#include "util/errors.hpp"
#include "util/random.hpp"
#include "util/timer.hpp"

namespace options = boost::program_options;

// parse a hex string into a seed of LAMBDA bits
BitString parseSeed(const std::string& hex) {
  if (hex.size() > LAMBDA / 4) {
    throw std::invalid_argument("seed longer than " + std::to_string(LAMBDA / 4) + " hex digits");
  }
  std::vector<unsigned char> bytes(LAMBDA / 8, 0);
  for (size_t i = 0; i < hex.size(); i++) {
    int nibble = std::stoi(hex.substr(i, 1), nullptr, 16);
    bytes[i / 2] |= (i % 2 == 0) ? (nibble << 4) : nibble;
  }
  return BitString(bytes, LAMBDA);
}

int run(
  const McEliece::Params& params, RandomSource& rng, const std::string& text,
  size_t weight, McEliece::DecodePolicy policy
) {
  Timer timer;

  std::cout << params.toString() << std::endl;
  auto dim = params.publicKeyDim();
  std::cout << "           message      : " << params.messageSize() << " bits" << std::endl;
  std::cout << "           ciphertext   : " << params.ciphertextSize() << " bits" << std::endl;
  std::cout << "           expansion    : " << params.expansion() << std::endl;
  std::cout << "           public key   : " << dim.first << " x " << dim.second
            << " (" << params.publicKeyBytes() << " bytes)" << std::endl << std::endl;

  timer.start("keygen", "sample S, P and G_pub");
  McEliece::KeyPair keys = McEliece::generateKeyPair(params.variant, params.blocks, rng);
  timer.stop();

  BitString message;
  if (text.empty()) {
    message = rng.bits(params.messageSize());
  } else {
    message = BitString::fromText(text);
    if (message.size() > params.messageSize()) {
      throw std::invalid_argument(
        "message needs " + std::to_string(message.size()) + " bits but the key holds "
        + std::to_string(params.messageSize())
      );
    }
    message += BitString(params.messageSize() - message.size());
  }

  timer.start("encrypt", std::to_string(weight) + " errors per block");
  BitString ciphertext = McEliece::encrypt(keys.publicKey, message, rng, weight);
  timer.stop();

  timer.start("decrypt", policy == McEliece::DecodePolicy::FailFast ? "fail fast" : "collect all");
  BitString decrypted = McEliece::decrypt(keys.privateKey, ciphertext, policy);
  timer.stop();

  std::cout << "           total        : " << std::fixed << std::setprecision(3)
            << timer.total() << " ms" << std::endl;
  if (!text.empty()) {
    std::cout << "           recovered    : " << decrypted.toText() << std::endl;
  }

  if (decrypted == message) {
    std::cout << GREEN << "[  done  ] success." << RESET << std::endl;
    return 0;
  }
  std::cout << RED << "[  done  ] failure: " << (decrypted ^ message).weight()
            << " bits differ." << RESET << std::endl;
  return 2;
}

int main(int argc, char *argv[]) {

  options::variables_map vm;
  options::options_description desc("allowed options");

  desc.add_options()
    ("help,h", "Display help message")
    ("code", options::value<std::string>()->default_value("bch"), "code to use: hamming or bch")
    ("blocks", options::value<unsigned>()->default_value(5), "number of blocks per message")
    ("message", options::value<std::string>()->default_value(""), "text to encrypt (random if empty)")
    ("seed", options::value<std::string>(), "hex seed for reproducible runs (system randomness if unset)")
    ("weight", options::value<unsigned>(), "errors per block (defaults to t)")
    ("collect", options::bool_switch(), "decode every block before reporting failures");

  try {
    options::store(options::parse_command_line(argc, argv, desc), vm);

    if (vm.count("help")) {
      std::cout << desc << "\n";
      return 0;
    }

    options::notify(vm);

    McEliece::Params params(
      Code::parseVariant(vm["code"].as<std::string>()), vm["blocks"].as<unsigned>()
    );

    std::unique_ptr<SeededRandom> seeded;
    if (vm.count("seed")) {
      seeded = std::make_unique<SeededRandom>(parseSeed(vm["seed"].as<std::string>()));
      std::cout << "[  info  ] seed " << seeded->seed().toHexString() << std::endl;
    }
    RandomSource& rng = seeded ? static_cast<RandomSource&>(*seeded) : SystemRandom::getInstance();

    size_t weight = vm.count("weight")
      ? vm["weight"].as<unsigned>()
      : params.code().params().t;

    McEliece::DecodePolicy policy = vm["collect"].as<bool>()
      ? McEliece::DecodePolicy::CollectAll
      : McEliece::DecodePolicy::FailFast;

    return run(params, rng, vm["message"].as<std::string>(), weight, policy);
  } catch (const options::error& ex) {
    std::cerr << "[mceliece] error: " << ex.what() << std::endl;
    return 1;
  } catch (const UncorrectableError& ex) {
    std::cerr << RED << "[mceliece] " << ex.what() << RESET << std::endl;
    return 2;
  } catch (const std::invalid_argument& ex) {
    std::cerr << "[mceliece] error: " << ex.what() << std::endl;
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << RED << "[mceliece] fatal: " << ex.what() << RESET << std::endl;
    return 3;
  }
}
