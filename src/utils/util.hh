#include <cstdlib>
#include <ctime>
#include <iostream>
#include <string>

#include <boost/filesystem.hpp>

#ifndef UTIL_HH_
#define UTIL_HH_

inline std::string
curr_time()
{
    time_t rawtime;
    time(&rawtime);
    struct tm timeinfo;
    localtime_r(&rawtime, &timeinfo);
    char buf[80];
    strftime(buf, sizeof(buf), "%c", &timeinfo);
    return std::string(buf);
}

inline bool
file_exists(const std::string filename)
{
    boost::system::error_code ec;
    return boost::filesystem::exists(filename, ec) && !ec;
}

#define TLOG(msg)                                                      \
    {                                                                  \
        std::cerr << "[" << curr_time() << "] " << msg << std::endl;   \
    }

#define WLOG(msg)                                                      \
    {                                                                  \
        std::cerr << "[" << curr_time() << "] [Warning] " << msg       \
                  << std::endl;                                        \
    }

#define ELOG(msg)                                                      \
    {                                                                  \
        std::cerr << "[" << curr_time() << "] [Error] " << msg         \
                  << std::endl;                                        \
    }

#define ERR_RET(cond, msg)                                             \
    {                                                                  \
        if (cond) {                                                    \
            ELOG(msg);                                                 \
            return EXIT_FAILURE;                                       \
        }                                                              \
    }

#define CHECK(cond)                                                    \
    {                                                                  \
        if ((cond) != EXIT_SUCCESS) {                                  \
            ELOG("[" << __FILE__ << ":" << __LINE__ << "] failed");    \
            std::exit(EXIT_FAILURE);                                   \
        }                                                              \
    }

#define CHK_ERR_RET(cond, msg)                                         \
    {                                                                  \
        if ((cond) != EXIT_SUCCESS) {                                  \
            ELOG(msg);                                                 \
            return EXIT_FAILURE;                                       \
        }                                                              \
    }

#endif
