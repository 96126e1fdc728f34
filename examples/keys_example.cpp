/**
 * @file keys_example.cpp
 * @brief Generate, restore and inspect Nostr keys from the command line
 *
 * Usage:
 *   nostrkeys_example generate
 *   nostrkeys_example restore <nsec-or-hex>
 *   nostrkeys_example inspect <npub-nsec-or-hex>
 */

#include "nostrkeys/keys/keys.hpp"
#include "nostrkeys/core/failures.hpp"

#include <iostream>
#include <string>
#include <string_view>

using namespace nostrkeys;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage:" << std::endl
              << "  " << program << " generate" << std::endl
              << "  " << program << " restore <nsec-or-hex>" << std::endl
              << "  " << program << " inspect <npub-nsec-or-hex>" << std::endl;
}

int report_failure(const KeyFailure& failure) {
    std::cerr << "Error (" << KeyFailureTypeName(failure.type) << "): "
              << failure.message << std::endl;
    return 1;
}

void print_public_key(const keys::PublicKey& public_key) {
    std::cout << "Public key (hex):    " << keys::ToHex(public_key) << std::endl;
    std::cout << "Public key (bech32): " << keys::ToHumanReadable(public_key) << std::endl;
}

void print_keypair(const keys::Keypair& keypair) {
    std::cout << "Secret key (hex):    " << keys::ToHex(keypair.GetSecretKey()) << std::endl;
    std::cout << "Secret key (bech32): " << keys::ToHumanReadable(keypair.GetSecretKey()) << std::endl;
    print_public_key(keypair.GetPublicKey());
}

int run_generate() {
    auto keypair_result = keys::Generate();
    if (keypair_result.IsErr()) {
        return report_failure(keypair_result.UnwrapErr());
    }
    print_keypair(keypair_result.Unwrap());
    return 0;
}

int run_restore(std::string_view input) {
    auto keypair_result = keys::ParseKeypair(input);
    if (keypair_result.IsErr()) {
        return report_failure(keypair_result.UnwrapErr());
    }
    print_keypair(keypair_result.Unwrap());
    return 0;
}

int run_inspect(std::string_view input) {
    auto keypair_result = keys::ParseKeypair(input);
    if (keypair_result.IsOk()) {
        std::cout << "Kind: keypair" << std::endl;
        print_keypair(keypair_result.Unwrap());
        return 0;
    }
    if (keypair_result.UnwrapErr().type != KeyFailureType::PublicKeyOnly) {
        return report_failure(keypair_result.UnwrapErr());
    }

    auto public_result = keys::ParsePublicKey(input);
    if (public_result.IsErr()) {
        return report_failure(public_result.UnwrapErr());
    }
    std::cout << "Kind: public key" << std::endl;
    print_public_key(public_result.Unwrap());
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string_view command = argv[1];
    if (command == "generate" && argc == 2) {
        return run_generate();
    }
    if (command == "restore" && argc == 3) {
        return run_restore(argv[2]);
    }
    if (command == "inspect" && argc == 3) {
        return run_inspect(argv[2]);
    }

    print_usage(argv[0]);
    return 1;
}
