#pragma once
#include <string>
#include <stdexcept>

class SubscoutError : public std::runtime_error {
public:
    explicit SubscoutError(const std::string& message) : std::runtime_error(message) {}
};

class InvalidLanguageError : public SubscoutError {
public:
    explicit InvalidLanguageError(const std::string& code)
        : SubscoutError("Invalid language: " + code), code_(code) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

class PluginError : public SubscoutError {
public:
    explicit PluginError(const std::string& message) : SubscoutError(message) {}
};

class InvalidStateError : public SubscoutError {
public:
    InvalidStateError(const std::string& current, const std::string& expected)
        : SubscoutError("Invalid state " + current + ", expected " + expected) {}
};

class WrongTaskKindError : public SubscoutError {
public:
    WrongTaskKindError() : SubscoutError("Only list and download tasks can be submitted") {}
};

class DownloadFailedError : public SubscoutError {
public:
    explicit DownloadFailedError(const std::string& message) : SubscoutError(message) {}
};
