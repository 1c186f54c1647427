// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license
// Test runner: Catch2 session with a --log-level option for the spdlog sinks

#include <catch2/catch_session.hpp>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

int main(int argc, char* argv[]) {
    Catch::Session session;

    // Quiet by default; --log-level=trace when chasing a failure
    std::string log_level = "off";
    using namespace Catch::Clara;
    auto cli = session.cli()
             | Opt(log_level, "level")
                   ["--log-level"]
                   ("spdlog level for the code under test (trace..off)");
    session.cli(cli);

    int rc = session.applyCommandLine(argc, argv);
    if (rc != 0) {
        return rc;
    }

    InitializeTestLogging(log_level);
    int result = session.run();
    ShutdownTestLogging();
    return result;
}
