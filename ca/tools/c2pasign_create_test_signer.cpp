/**
 * @file c2pasign_create_test_signer.cpp
 * @brief Tool for creating the static ES256 test signing material
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/ca/certificate_authority.h"
#include <glog/logging.h>
#include <fstream>
#include <iostream>

namespace {

constexpr const char* CERT_CHAIN_FILE = "es256_certs.pem";
constexpr const char* PRIVATE_KEY_FILE = "es256_private.key";

void PrintUsage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Bootstrap a throwaway test CA and issue an ES256 signing certificate\n"
              << "for C2PA manifest signing\n"
              << "\n"
              << "Required:\n"
              << "  --output-dir DIR       Directory receiving " << CERT_CHAIN_FILE
              << " and " << PRIVATE_KEY_FILE << "\n"
              << "\n"
              << "Optional:\n"
              << "  --validity-days DAYS   Validity period in days (default: 365)\n"
              << "  --common-name NAME     Subject common name (default: \"Temporary C2PA Signer\")\n"
              << "  --help                 Show this help\n"
              << "\n"
              << "Example:\n"
              << "  c2pasign-create-test-signer --output-dir Resources --validity-days 30\n";
}

bool WriteFile(const std::string& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    return static_cast<bool>(out);
}

}  // namespace

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;
    FLAGS_minloglevel = 2;  // ERROR level by default

    std::string output_dir;
    std::string common_name;
    int validity_days = 365;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "--output-dir" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--common-name" && i + 1 < argc) {
            common_name = argv[++i];
        } else if (arg == "--validity-days" && i + 1 < argc) {
            try {
                validity_days = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --validity-days expects a number\n";
                return 1;
            }
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            PrintUsage(argv[0]);
            return 1;
        }
    }

    if (output_dir.empty()) {
        std::cerr << "Error: Missing required arguments\n\n";
        PrintUsage(argv[0]);
        return 1;
    }

    if (validity_days <= 0) {
        std::cerr << "Error: --validity-days must be positive\n";
        return 1;
    }

    try {
        c2pasign::ca::CertificateAuthority authority;

        c2pasign::DistinguishedName subject = c2pasign::ca::DefaultSignerSubject();
        if (!common_name.empty()) {
            subject.common_name = common_name;
        }

        auto signer = authority.IssueSigner(subject, validity_days);

        const std::string chain_path = output_dir + "/" + CERT_CHAIN_FILE;
        const std::string key_path = output_dir + "/" + PRIVATE_KEY_FILE;

        if (!WriteFile(chain_path, signer.certificate_chain + "\n")) {
            std::cerr << "Error: Cannot write to " << chain_path << "\n";
            return 1;
        }
        if (!WriteFile(key_path, signer.private_key_pem)) {
            std::cerr << "Error: Cannot write to " << key_path << "\n";
            return 1;
        }

        std::cout << "Created ES256 test signer:\n"
                  << "  Subject: " << signer.certificate.GetSubject() << "\n"
                  << "  Serial: " << signer.certificate.GetSerialNumberString() << "\n"
                  << "  Validity: " << validity_days << " days\n"
                  << "  Chain: " << chain_path << "\n"
                  << "  Key: " << key_path << "\n";

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
