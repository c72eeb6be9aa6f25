// Tests for dotenv parsing and loading into the process environment.

#include "utils/env_file.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdlib.h>
#include <string>
#include <unistd.h>

namespace test_env_file {

static bool report(bool success, const std::string &description) {
    if (success) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return success;
}

// Test: comments, blank lines, export prefix and quotes.
static bool test_parse_rules() {
    std::string contents =
        "# comment\n"
        "\n"
        "PLAIN=value\n"
        "export EXPORTED=yes\n"
        "DOUBLE=\"two words\"\n"
        "SINGLE='it''s'\n"
        "  SPACED  =  padded  \n"
        "EMPTY=\n"
        "EQUALS=a=b\n";
    auto entries = env_file::parse(contents);

    bool success = entries.size() == 7 &&
                   entries[0] == env_file::EnvEntry("PLAIN", "value") &&
                   entries[1] == env_file::EnvEntry("EXPORTED", "yes") &&
                   entries[2] == env_file::EnvEntry("DOUBLE", "two words") &&
                   entries[3] == env_file::EnvEntry("SINGLE", "it''s") &&
                   entries[4] == env_file::EnvEntry("SPACED", "padded") &&
                   entries[5] == env_file::EnvEntry("EMPTY", "") &&
                   entries[6] == env_file::EnvEntry("EQUALS", "a=b");
    return report(success, "Env file lines are parsed with comments, export and quotes handled");
}

// Test: lines without '=' or with invalid keys are skipped.
static bool test_parse_skips_malformed_lines() {
    auto entries = env_file::parse("NOEQUALS\n1BAD=x\nBAD-KEY=y\n=novalue\nGOOD=z\r\n");
    bool success = entries.size() == 1 && entries[0] == env_file::EnvEntry("GOOD", "z");
    return report(success, "Malformed lines are skipped and CRLF endings tolerated");
}

// Test: load applies new variables but never overrides existing ones.
static bool test_load_does_not_override() {
    std::string path = "/tmp/clexec_test_env_" + std::to_string(getpid());
    {
        std::ofstream file(path);
        file << "CLEXEC_TEST_NEW=from_file\n";
        file << "CLEXEC_TEST_EXISTING=from_file\n";
    }
    unsetenv("CLEXEC_TEST_NEW");
    setenv("CLEXEC_TEST_EXISTING", "from_process", 1);

    int applied = env_file::load(path);
    const char *new_value = std::getenv("CLEXEC_TEST_NEW");
    const char *existing_value = std::getenv("CLEXEC_TEST_EXISTING");

    bool success = applied == 1 && new_value != nullptr && std::string(new_value) == "from_file" &&
                   existing_value != nullptr && std::string(existing_value) == "from_process";

    unsetenv("CLEXEC_TEST_NEW");
    unsetenv("CLEXEC_TEST_EXISTING");
    std::remove(path.c_str());
    return report(success, "load() applies new variables and keeps existing ones");
}

// Test: a missing file is reported, not fatal.
static bool test_load_missing_file() {
    bool success = env_file::load("/definitely/not/a/real/.env") == -1;
    return report(success, "load() returns -1 for a missing file");
}

// Test: CLEXEC_ENV_FILE selects the path, default is .env.
static bool test_default_path() {
    unsetenv("CLEXEC_ENV_FILE");
    bool default_ok = env_file::default_path() == ".env";
    setenv("CLEXEC_ENV_FILE", "/etc/clexec.env", 1);
    bool configured_ok = env_file::default_path() == "/etc/clexec.env";
    unsetenv("CLEXEC_ENV_FILE");
    return report(default_ok && configured_ok, "default_path() honours CLEXEC_ENV_FILE");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_parse_rules();
    all_passed &= test_parse_skips_malformed_lines();
    all_passed &= test_load_does_not_override();
    all_passed &= test_load_missing_file();
    all_passed &= test_default_path();
    return all_passed;
}

} // namespace test_env_file
