// Replays fuzz inputs through a target when libFuzzer is unavailable.
// Usage: <target> <file-or-directory>...
// Directories are walked non-recursively, so a libFuzzer corpus can be
// replayed as-is.

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

namespace {

bool RunFile(const std::filesystem::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::fprintf(stderr, "cannot open %s\n", path.c_str());
        return false;
    }
    std::vector<uint8_t> input((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    LLVMFuzzerTestOneInput(input.data(), input.size());
    return true;
}

} // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s <input-file-or-corpus-dir>...\n", argv[0]);
        return 1;
    }

    size_t executed = 0;
    size_t failed = 0;
    for (int i = 1; i < argc; ++i) {
        std::filesystem::path arg(argv[i]);
        std::error_code ec;
        if (std::filesystem::is_directory(arg, ec)) {
            for (const auto &entry : std::filesystem::directory_iterator(arg, ec)) {
                if (!entry.is_regular_file())
                    continue;
                RunFile(entry.path()) ? ++executed : ++failed;
            }
            if (ec) {
                std::fprintf(stderr, "cannot list %s: %s\n", argv[i], ec.message().c_str());
                ++failed;
            }
        } else {
            RunFile(arg) ? ++executed : ++failed;
        }
    }

    std::printf("Executed %zu input(s), %zu unreadable\n", executed, failed);
    return failed == 0 ? 0 : 1;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
