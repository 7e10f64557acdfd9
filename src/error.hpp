#pragma once

#include <stdexcept>
#include <string>

namespace minawallet {

// Raised by the key codec when text or bytes cannot be turned into keys,
// or when the curve backend refuses an operation.
class KeyCodecError : public std::runtime_error {
public:
    enum class ErrorType {
        InvalidHex,
        InvalidLength,
        Base58Decode,
        ChecksumMismatch,
        InvalidVersion,
        ScalarOutOfRange,
        NonCurvePoint,
        EntropyUnavailable,
        Backend
    };

    KeyCodecError(ErrorType type, const std::string& message = "")
        : std::runtime_error(message.empty() ? "Key codec error" : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

private:
    ErrorType type_;
};

// Wallet-level failures. what() is "<kind>: <detail>", detail() is the
// codec message on its own.
class WalletError : public std::runtime_error {
public:
    enum class ErrorType {
        InvalidSecretKey,
        InvalidAddress,
        SigningFailed,
        KeypairGenerationFailed
    };

    WalletError(ErrorType type, const std::string& detail)
        : std::runtime_error(prefix(type) + detail)
        , type_(type)
        , detail_(detail)
    {}

    ErrorType type() const { return type_; }
    const std::string& detail() const { return detail_; }

private:
    static std::string prefix(ErrorType type) {
        switch (type) {
            case ErrorType::InvalidSecretKey:
                return "Invalid secret key: ";
            case ErrorType::InvalidAddress:
                return "Invalid address: ";
            case ErrorType::SigningFailed:
                return "Signing failed: ";
            case ErrorType::KeypairGenerationFailed:
                return "Keypair generation failed: ";
        }
        return "Wallet error: ";
    }

    ErrorType type_;
    std::string detail_;
};

} // namespace minawallet
