#ifndef EMUFLOW_TEST_SUPPORT_H
#define EMUFLOW_TEST_SUPPORT_H

#include <stdexcept>
#include <string>

// Failed expectations throw so main() can report [FAILED] and exit non-zero
#define CHECK(condition)                                                              \
    do {                                                                              \
        if (!(condition)) {                                                           \
            throw std::runtime_error(std::string(__FILE__) + ":" +                    \
                                     std::to_string(__LINE__) + ": CHECK(" #condition \
                                     ") failed");                                     \
        }                                                                             \
    } while (0)

#define CHECK_THROWS_AS(statement, ExceptionType)                                         \
    do {                                                                                  \
        bool caught = false;                                                              \
        try {                                                                             \
            statement;                                                                    \
        } catch (const ExceptionType&) {                                                  \
            caught = true;                                                                \
        }                                                                                 \
        if (!caught) {                                                                    \
            throw std::runtime_error(std::string(__FILE__) + ":" +                        \
                                     std::to_string(__LINE__) + ": expected " #ExceptionType \
                                     " from " #statement);                                \
        }                                                                                 \
    } while (0)

#endif // EMUFLOW_TEST_SUPPORT_H
