#ifndef QB_MODULE_GATE_LOGGER_H_
#define QB_MODULE_GATE_LOGGER_H_

#include <qb/io.h> // This should include nanolog.h if QB_LOGGER is defined

// Common prefix for all qbm-gate logs.
#define QBM_GATE_LOG_PREFIX "[qbm-gate] "

#ifdef QB_LOGGER

// TRACE maps to DEBUG for nanolog.
#define LOG_GATE_TRACE(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::DEBUG) && \
           NANO_LOG(nanolog::LogLevel::DEBUG) << QBM_GATE_LOG_PREFIX << "TRACE: " << X)

#define LOG_GATE_DEBUG(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::DEBUG) && \
           NANO_LOG(nanolog::LogLevel::DEBUG) << QBM_GATE_LOG_PREFIX << "DEBUG: " << X)

#define LOG_GATE_INFO(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::INFO) && \
           NANO_LOG(nanolog::LogLevel::INFO) << QBM_GATE_LOG_PREFIX << "INFO: " << X)

#define LOG_GATE_WARN(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::WARN) && \
           NANO_LOG(nanolog::LogLevel::WARN) << QBM_GATE_LOG_PREFIX << "WARN: " << X)

#define LOG_GATE_ERROR(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::CRIT) && \
           NANO_LOG(nanolog::LogLevel::CRIT) << QBM_GATE_LOG_PREFIX << "ERROR: " << X) // ERROR is CRIT in nanolog

#define LOG_GATE_CRIT(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::CRIT) && \
           NANO_LOG(nanolog::LogLevel::CRIT) << QBM_GATE_LOG_PREFIX << "CRITICAL: " << X)

#else // QB_LOGGER not defined, fallback to QB_STDOUT_LOG or no-op

#ifdef QB_STDOUT_LOG
#define LOG_GATE_TRACE(X) qb::io::cout() << QBM_GATE_LOG_PREFIX << "TRACE: " << X << std::endl
#define LOG_GATE_DEBUG(X) qb::io::cout() << QBM_GATE_LOG_PREFIX << "DEBUG: " << X << std::endl
#define LOG_GATE_INFO(X)  qb::io::cout() << QBM_GATE_LOG_PREFIX << "INFO: " << X << std::endl
#define LOG_GATE_WARN(X)  qb::io::cout() << QBM_GATE_LOG_PREFIX << "WARN: " << X << std::endl
#define LOG_GATE_ERROR(X) qb::io::cerr() << QBM_GATE_LOG_PREFIX << "ERROR: " << X << std::endl
#define LOG_GATE_CRIT(X)  qb::io::cerr() << QBM_GATE_LOG_PREFIX << "CRITICAL: " << X << std::endl

#else // QB_STDOUT_LOG not defined, logs are no-ops

#define LOG_GATE_TRACE(X) do {} while (false)
#define LOG_GATE_DEBUG(X) do {} while (false)
#define LOG_GATE_INFO(X)  do {} while (false)
#define LOG_GATE_WARN(X)  do {} while (false)
#define LOG_GATE_ERROR(X) do {} while (false)
#define LOG_GATE_CRIT(X)  do {} while (false)

#endif // QB_STDOUT_LOG
#endif // QB_LOGGER

// Request-scoped variants: prefix the message with "<method> <path>: ".
#define LOG_GATE_TRACE_REQ(REQ, X) LOG_GATE_TRACE((REQ).method() << " " << (REQ).path() << ": " << X)
#define LOG_GATE_DEBUG_REQ(REQ, X) LOG_GATE_DEBUG((REQ).method() << " " << (REQ).path() << ": " << X)
#define LOG_GATE_INFO_REQ(REQ, X)  LOG_GATE_INFO((REQ).method() << " " << (REQ).path() << ": " << X)
#define LOG_GATE_WARN_REQ(REQ, X)  LOG_GATE_WARN((REQ).method() << " " << (REQ).path() << ": " << X)
#define LOG_GATE_ERROR_REQ(REQ, X) LOG_GATE_ERROR((REQ).method() << " " << (REQ).path() << ": " << X)

#endif // QB_MODULE_GATE_LOGGER_H_
