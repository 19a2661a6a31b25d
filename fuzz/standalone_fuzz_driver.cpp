// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

// Standalone fuzz driver for testing fuzz targets when libFuzzer is not available
// Replays corpus files through a target on systems without libFuzzer

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <vector>

// Forward declare the fuzzer entry point
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

int main(int argc, char** argv) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <input_file>...\n", argv[0]);
        fprintf(stderr, "\nReplays each file through the target once.\n");
        fprintf(stderr, "For coverage-guided fuzzing, configure with IPC_FUZZ_LIBFUZZER=ON\n");
        fprintf(stderr, "using clang.\n");
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        std::ifstream file(argv[i], std::ios::binary | std::ios::ate);
        if (!file) {
            fprintf(stderr, "Error: Cannot open file '%s'\n", argv[i]);
            return 1;
        }

        std::streamsize size = file.tellg();
        file.seekg(0, std::ios::beg);

        std::vector<uint8_t> buffer(static_cast<size_t>(size));
        if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
            fprintf(stderr, "Error: Cannot read file '%s'\n", argv[i]);
            return 1;
        }

        LLVMFuzzerTestOneInput(buffer.data(), buffer.size());
        printf("%s: ok (%zd bytes)\n", argv[i], size);
    }
    return 0;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
