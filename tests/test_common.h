// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TEST_COMMON_H_2049185734012856
#define TEST_COMMON_H_2049185734012856

#include <iostream>
#include <string>
#include <zen/extra_log.h>


namespace test
{
// Test statistics
struct TestStats
{
    int total = 0;
    int passed = 0;
    int failed = 0;

    void print() const
    {
        std::cout << "\n========== Test Results ==========\n";
        std::cout << "Total:  " << total << "\n";
        std::cout << "Passed: " << passed << " ("
                  << (total > 0 ? (passed * 100.0 / total) : 0) << "%)\n";
        std::cout << "Failed: " << failed << "\n";
        std::cout << "==================================\n";
    }

    int exitCode() const { return failed == 0 ? 0 : 1; }
};


inline
void check(TestStats& stats, bool condition, const std::string& description)
{
    stats.total++;
    if (condition)
    {
        stats.passed++;
        std::cout << "  ✓ " << description << "\n";
    }
    else
    {
        stats.failed++;
        std::cout << "  ✗ " << description << "\n";
    }
}


template <class Exception, class Function>
void checkThrows(TestStats& stats, Function fun, const std::string& description)
{
    bool thrown = false;
    try
    {
        fun();
    }
    catch (const Exception&) { thrown = true; }

    check(stats, thrown, description);
}


inline
bool logContains(const zen::ErrorLog& log, zen::MessageType type, const std::string& text)
{
    for (const zen::LogEntry& entry : log)
        if (entry.type == type && entry.message.find(text) != std::string::npos)
            return true;
    return false;
}
}

#endif //TEST_COMMON_H_2049185734012856
