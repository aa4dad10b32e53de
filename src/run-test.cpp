/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <chrono>
#include <sys/resource.h>
#include <iostream>
#include <provledger/common/test.hpp>

int main(const int argc, const char **argv)
{
    using namespace provledger;
    const auto start = std::chrono::steady_clock::now();
    if (argc >= 2) {
        std::cerr << fmt::format("using test-filter mask: {}\n", argv[1]);
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    {
#       ifdef PROVLEDGER_STACK_SIZE
            static constexpr size_t stack_size = PROVLEDGER_STACK_SIZE;
#       else
            static constexpr size_t stack_size = 32ULL << 20U;
#       endif
        struct rlimit rl;
        if (getrlimit(RLIMIT_STACK, &rl) != 0) [[unlikely]]
            throw error_sys("getrlimit RLIMIT_STACK failed!");
        if (rl.rlim_cur < stack_size) {
            rl.rlim_cur = stack_size;
            if (setrlimit(RLIMIT_STACK, &rl) != 0) [[unlikely]]
                throw error_sys("setrlimit RLIMIT_STACK failed!");
        }
        std::cerr << fmt::format("stack size: {} MB\n", rl.rlim_cur >> 20);
    }
    // run returns true when any of the tests has failed
    const bool failed = boost::ut::cfg<boost::ut::override>.run();
    const std::chrono::duration<double> took = std::chrono::steady_clock::now() - start;
    logger::info("run-test finished in {:.3f} sec", took.count());
    return failed ? 1 : 0;
}
