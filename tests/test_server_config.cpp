/**
 * test_server_config.cpp
 *
 * Unit tests for environment-driven server configuration.
 */

#include "core/config/ServerConfig.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <stdexcept>

using namespace potlog;

// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(const char* key, const char* value) : key_(key) { setenv(key, value, 1); }
    ~EnvGuard() { unsetenv(key_); }
    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

private:
    const char* key_;
};

bool TestDefaults() {
    ServerConfig c = loadServerConfig();
    ASSERT_EQ(c.port, 9292, "default port");
    ASSERT_EQ(c.store, std::string("s3"), "default store");
    ASSERT_EQ(c.transfer.multipart_threshold, static_cast<std::uint64_t>(1000000000), "default threshold");
    ASSERT_EQ(c.transfer.part_size, static_cast<std::uint64_t>(500000000), "default part size");
    ASSERT_EQ(c.transfer.import_bucket, std::string("pottery-log-exports"), "default import bucket");
    return true;
}

bool TestOverrides() {
    EnvGuard port("POTLOG_PORT", "8080");
    EnvGuard store("POTLOG_STORE", "local");
    EnvGuard threshold("POTLOG_MULTIPART_THRESHOLD", "5000");
    ServerConfig c = loadServerConfig();
    ASSERT_EQ(c.port, 8080, "port override");
    ASSERT_EQ(c.store, std::string("local"), "store override");
    ASSERT_EQ(c.transfer.multipart_threshold, static_cast<std::uint64_t>(5000), "threshold override");
    return true;
}

bool TestOutOfRangePortFallsBack() {
    {
        EnvGuard port("POTLOG_PORT", "4294967297");
        ASSERT_EQ(loadServerConfig().port, 9292, "value past the int range is rejected");
    }
    {
        EnvGuard port("POTLOG_PORT", "70000");
        ASSERT_EQ(loadServerConfig().port, 9292, "value past 65535 is rejected");
    }
    {
        EnvGuard port("POTLOG_PORT", "0");
        ASSERT_EQ(loadServerConfig().port, 9292, "zero is rejected");
    }
    {
        EnvGuard port("POTLOG_PORT", "65535");
        ASSERT_EQ(loadServerConfig().port, 65535, "highest port accepted");
    }
    return true;
}

bool TestNonNumericFallsBack() {
    EnvGuard size("POTLOG_PART_SIZE", "lots");
    ASSERT_EQ(loadServerConfig().transfer.part_size, static_cast<std::uint64_t>(500000000),
              "non-numeric value uses the default");
    return true;
}

bool TestUnknownStoreRejected() {
    EnvGuard store("POTLOG_STORE", "ftp");
    ASSERT_THROWS(loadServerConfig(), std::runtime_error, "unknown store kind");
    return true;
}

int main() {
    TestRunner runner("ServerConfig Tests");
    runner.run(TestDefaults, "Defaults");
    runner.run(TestOverrides, "Overrides");
    runner.run(TestOutOfRangePortFallsBack, "Out-of-range port falls back");
    runner.run(TestNonNumericFallsBack, "Non-numeric value falls back");
    runner.run(TestUnknownStoreRejected, "Unknown store rejected");
    return runner.finish();
}
