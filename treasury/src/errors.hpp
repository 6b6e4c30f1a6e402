#pragma once

#include <stdexcept>
#include <string>

// Rate for a required currency pair is not available on or before the date.
class MissingRateError : public std::runtime_error {
public:
    MissingRateError(const std::string& pair, const std::string& date)
        : std::runtime_error("No FX rate for " + pair + " on or before " + date)
        , pair_(pair)
        , date_(date)
    {}
    
    const std::string& pair() const { return pair_; }
    const std::string& date() const { return date_; }
    
private:
    std::string pair_;
    std::string date_;
};

// Pool cannot be computed: empty participant list or an account shared
// with another active pool.
class InvalidPoolConfigurationError : public std::runtime_error {
public:
    InvalidPoolConfigurationError(const std::string& pool_name, const std::string& reason)
        : std::runtime_error("Invalid pool '" + pool_name + "': " + reason)
        , pool_name_(pool_name)
    {}
    
    const std::string& pool_name() const { return pool_name_; }
    
private:
    std::string pool_name_;
};

class MalformedRecordError : public std::runtime_error {
public:
    MalformedRecordError(const std::string& kind, const std::string& reason)
        : std::runtime_error("Malformed " + kind + " record: " + reason)
        , kind_(kind)
        , reason_(reason)
    {}
    
    const std::string& kind() const { return kind_; }
    const std::string& reason() const { return reason_; }
    
private:
    std::string kind_;
    std::string reason_;
};

class SnapshotEmptyError : public std::runtime_error {
public:
    explicit SnapshotEmptyError(const std::string& date)
        : std::runtime_error("No accounts or balances for " + date)
        , date_(date)
    {}
    
    const std::string& date() const { return date_; }
    
private:
    std::string date_;
};

class PoolNotFoundError : public std::runtime_error {
public:
    explicit PoolNotFoundError(const std::string& region)
        : std::runtime_error("No pool found for region " + region)
    {}
};
