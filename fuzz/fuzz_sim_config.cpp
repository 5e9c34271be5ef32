// Fuzz target for simulator configuration parsing
// Tests LoadConfigFile with malformed JSON and ParseCommandLine with arbitrary arguments
//
// Config parsing takes untrusted text. Bugs can cause:
// - Crashes on malformed JSON or odd option spellings
// - Exceptions escaping the bool/error-string interface
// - Out-of-range values slipping past validation
//
// Target code:
// - src/app/sim_config.cpp (LoadConfigFile, ParseCommandLine, ValidateConfig)

#include "app/sim_config.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <filesystem>
#include <fstream>
#include <system_error>

using namespace chainsync::app;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size == 0) return 0;

    const uint8_t mode = data[0];
    const std::string text(reinterpret_cast<const char*>(data + 1), size - 1);

    // Test 1: config file contents
    if ((mode & 0x01) == 0) {
        auto fuzz_dir = std::filesystem::temp_directory_path() / "chainsync_fuzz_config";
        std::error_code ec;
        std::filesystem::create_directories(fuzz_dir, ec);
        if (ec) return 0;

        auto config_file = fuzz_dir / "fuzzed.json";
        {
            std::ofstream out(config_file, std::ios::binary | std::ios::trunc);
            if (!out) return 0;
            out.write(text.data(), static_cast<std::streamsize>(text.size()));
        }

        try {
            SimConfig config;
            std::string error;
            bool ok = LoadConfigFile(config_file.string(), config, error);

            // Failure must say why - BUG otherwise
            if (!ok && error.empty()) {
                __builtin_trap();
            }
            if (ok && (config.drop_rate < 0.0 || config.drop_rate > 1.0)) {
                __builtin_trap();
            }
        } catch (const std::exception&) {
            // LoadConfigFile reports through `error`, never by throwing
            __builtin_trap();
        }

        std::filesystem::remove(config_file, ec);
    }

    // Test 2: command line split on NUL bytes
    if ((mode & 0x01) == 1) {
        std::vector<std::string> args;
        size_t start = 0;
        for (size_t i = 0; i <= text.size(); i++) {
            if (i == text.size() || text[i] == '\0') {
                std::string arg = text.substr(start, i - start);
                // Keep the fuzzer off the filesystem
                if (!arg.starts_with("--config")) {
                    args.push_back(arg);
                }
                start = i + 1;
            }
        }

        try {
            SimConfig config;
            std::string error;
            bool ok = ParseCommandLine(args, config, error);
            if (!ok && error.empty()) {
                __builtin_trap();
            }
            if (ok) {
                std::string validation_error;
                if (!ValidateConfig(config, validation_error) && validation_error.empty()) {
                    __builtin_trap();
                }
                if (config.drop_rate < 0.0 || config.drop_rate > 1.0) {
                    __builtin_trap();
                }
            }
        } catch (const std::exception&) {
            __builtin_trap();
        }
    }

    return 0;
}
