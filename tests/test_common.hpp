#pragma once
#include <cstdio>
#include <cmath>

// Shared by the test executables: print one [PASS]/[FAIL] line per check
// and count failures; main() returns g_failures.
static int g_failures = 0;

static void check(const char* name, bool ok){
    if(ok) std::printf("[PASS] %s\n", name);
    else { std::printf("[FAIL] %s\n", name); g_failures++; }
}

static void check_near(const char* name, double got, double want, double eps){
    double err = std::fabs(got - want);
    if(err > eps){
        std::printf("[FAIL] %s: got=%.9g want=%.9g (|err|=%.3g)\n", name, got, want, err);
        g_failures++;
    } else {
        std::printf("[PASS] %s: got=%.9g want=%.9g\n", name, got, want);
    }
}
