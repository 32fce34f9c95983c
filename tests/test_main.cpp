// tests/test_main.cpp - runner for the collaborator suites (angle, geodesy,
// binary stars, Moon, refraction)
//
// Each suite reports through test::check / test::checkNear and the
// process exits non-zero if any check failed.

#include "test_main.hpp"
#include "core/logger.hpp"
#include <iostream>
#include <string>

namespace test {

static int s_pass = 0;
static int s_fail = 0;

void pass(const std::string& name) {
    std::cout << "  [PASS] " << name << "\n";
    ++s_pass;
}

void fail(const std::string& name, const std::string& msg) {
    std::cout << "  [FAIL] " << name << " : " << msg << "\n";
    ++s_fail;
}

int summary() {
    int total = s_pass + s_fail;
    std::cout << "\n========================================\n"
              << " Results: " << s_pass << "/" << total << " passed";
    if (s_fail > 0) std::cout << "  (" << s_fail << " FAILED)";
    std::cout << "\n========================================\n";
    return (s_fail == 0) ? 0 : 1;
}

} // namespace test

// Forward declarations for test suites
int testAngle();
int testEarth();
int testBinaryStar();
int testLunar();
int testAtmosphere();
int testLogger();

int main() {
    std::cout << "ALMANAC Collaborator Tests\n"
              << "========================================\n";

    std::cout << "\n[Angle]\n";
    testAngle();

    std::cout << "\n[Earth]\n";
    testEarth();

    std::cout << "\n[Binary Star]\n";
    testBinaryStar();

    std::cout << "\n[Lunar]\n";
    testLunar();

    std::cout << "\n[Atmosphere]\n";
    testAtmosphere();

    std::cout << "\n[Logger]\n";
    testLogger();

    almanac::core::Logger::shutdown();
    return test::summary();
}
