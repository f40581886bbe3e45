// tests/test_framework/test_entrypoint.cpp
/**
 * @file test_entrypoint.cpp
 * @brief Main entry point for the ljdaq test executables.
 *
 * Runs GoogleTest in-process. The device tests never touch hardware: they
 * drive the helpers through a gmock `MockDriver`. The Logger singleton is
 * shared by all tests in an executable and is drained once, after the last
 * test.
 */
#include "test_entrypoint.h"
#include "utils/logger.hpp"

#include <atomic>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include <unistd.h>

namespace fs = std::filesystem;

namespace ljdaq::tests::helper
{

fs::path unique_temp_path(const std::string &stem, const std::string &extension)
{
    static std::atomic<int> counter{0};
    auto p = fs::temp_directory_path() /
             fmt::format("ljdaq_test_{}_{}_{}{}", stem, ::getpid(), counter.fetch_add(1),
                         extension);
    std::error_code ec;
    fs::remove(p, ec);
    return p;
}

std::string read_file_contents(const fs::path &path)
{
    std::ifstream in(path);
    if (!in)
        return {};
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

ScopedEnv::ScopedEnv(std::string name, const std::string &value) : name_(std::move(name))
{
    if (const char *prev = std::getenv(name_.c_str()))
    {
        had_previous_ = true;
        previous_ = prev;
    }
    ::setenv(name_.c_str(), value.c_str(), 1);
}

ScopedEnv::~ScopedEnv()
{
    if (had_previous_)
        ::setenv(name_.c_str(), previous_.c_str(), 1);
    else
        ::unsetenv(name_.c_str());
}

} // namespace ljdaq::tests::helper

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    auto drain_logger =
        ljdaq::utils::make_scope_guard([] { ljdaq::utils::Logger::instance().shutdown(); });
    return RUN_ALL_TESTS();
}
