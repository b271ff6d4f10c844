#ifndef CAMSCOUT_LOG_MACROS_HPP
#define CAMSCOUT_LOG_MACROS_HPP
/**
 * @file log_macros.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Stream style logging helpers. The enclosing scope must provide a
 * log_callback_t named m_log_callback.
 */
#include "CommonTypes.hpp"
#include <sstream>

#define DBG(m,l)                                        \
     do                                                 \
     {                                                  \
         if (m_log_callback) {                          \
             std::stringstream ss {};                   \
             ss << m;                                   \
             m_log_callback(ss.str(), l);               \
         }                                              \
     } while(false)

#define ERR(m)                                          \
    do                                                  \
    {                                                   \
        if (m_log_callback) {                           \
            std::stringstream ss {};                    \
            ss << m;                                    \
            m_log_callback(ss.str(), ::camscout::LOG_LVL_ERROR); \
        }                                               \
    } while(false)

#endif // CAMSCOUT_LOG_MACROS_HPP
