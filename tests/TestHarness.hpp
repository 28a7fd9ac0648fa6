#pragma once

#include <QByteArray>
#include <QString>

#include <algorithm>
#include <iostream>
#include <string>
#include <type_traits>
#include <vector>

namespace tests {

struct TestResult {
    std::string name;
    bool passed;
};

extern std::vector<TestResult> results;
extern std::string lastError;

// Fail the current test, recording the message, unless cond holds
#define EXPECT(cond, falseMessage)                                      \
    do {                                                                \
        tests::lastError.clear();                                       \
        if (!(cond)) {                                                  \
            tests::lastError = falseMessage;                            \
            return false;                                               \
        }                                                               \
    } while (0)

// Like EXPECT, reporting both sides of a failed comparison
#define EXPECT_EQ(actual, expected, falseMessage)                       \
    do {                                                                \
        tests::lastError.clear();                                       \
        if (!((actual) == (expected))) {                                \
            tests::lastError = std::string(falseMessage) + " (got '" +  \
                tests::show(actual) + "', expected '" +                 \
                tests::show(expected) + "')";                           \
            return false;                                               \
        }                                                               \
    } while (0)

#define RUN_TEST(fn)                                                    \
    do {                                                                \
        bool ok = fn();                                                 \
        tests::results.push_back({#fn, ok});                            \
        std::cout << (ok? "[ ok ] " : "[FAIL] ") << #fn;                \
        if (!ok)                                                        \
            std::cout << " FAILED: " << tests::lastError;               \
        std::cout << "\n";                                              \
    } while (0)

#define SUBCAT(msg)                                                     \
    do {                                                                \
        std::string str(msg);                                           \
        std::transform(str.begin(), str.end(), str.begin(), ::toupper); \
        std::cout << "-------" << str << "--------------\n";            \
    } while (0)

inline std::string show(const QString& value) { return value.toStdString(); }
inline std::string show(const QByteArray& value) { return value.toStdString(); }
inline std::string show(const char* value) { return value; }
inline std::string show(const std::string& value) { return value; }
inline std::string show(bool value) { return value? "true" : "false"; }
template<typename Number, typename = std::enable_if_t<std::is_arithmetic<Number>::value>>
std::string show(Number value) { return std::to_string(value); }

} // namespace tests
