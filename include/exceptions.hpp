#pragma once

#include <string>
#include <exception>

enum ErrorCode {
    ERR_NONE = 0,
    ERR_CALIBRATION,
    ERR_TRANSPORT,
    ERR_TRANSPORT_TIMEOUT,
    ERR_PERSISTENCE,
    ERR_UNKNOWN
};

class CalibrationException : public std::exception {
public:
    CalibrationException(const std::string& msg, ErrorCode code = ERR_CALIBRATION) : message_(msg), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    virtual ~CalibrationException() noexcept {}
private:
    std::string message_;
    ErrorCode code_;
};

class TransportException : public std::exception {
public:
    TransportException(const std::string& msg, ErrorCode code = ERR_TRANSPORT) : message_(msg), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    virtual ~TransportException() noexcept {}
private:
    std::string message_;
    ErrorCode code_;
};

class PersistenceException : public std::exception {
public:
    PersistenceException(const std::string& msg, ErrorCode code = ERR_PERSISTENCE) : message_(msg), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    virtual ~PersistenceException() noexcept {}
private:
    std::string message_;
    ErrorCode code_;
};
