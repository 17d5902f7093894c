#include "../include/Callout/Errors.h"

namespace Callout {

std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::EmptyInput:
            return "EmptyInput";
        case ErrorKind::MalformedHex:
            return "MalformedHex";
        case ErrorKind::NetworkError:
            return "NetworkError";
        case ErrorKind::MissingApiKey:
            return "MissingApiKey";
        case ErrorKind::TransactionNotFound:
            return "TransactionNotFound";
        case ErrorKind::TransactionNotFoundOnAnyNetwork:
            return "TransactionNotFoundOnAnyNetwork";
        case ErrorKind::SignatureRecoveryFailed:
            return "SignatureRecoveryFailed";
        case ErrorKind::AddressMismatch:
            return "AddressMismatch";
        case ErrorKind::NoOutgoingTransactionsFound:
            return "NoOutgoingTransactionsFound";
        case ErrorKind::UnsupportedChain:
            return "UnsupportedChain";
        case ErrorKind::InvalidPublicKey:
            return "InvalidPublicKey";
        case ErrorKind::InvalidPrivateKey:
            return "InvalidPrivateKey";
        case ErrorKind::DecryptionFailed:
            return "DecryptionFailed";
        case ErrorKind::NotAnEncryptedPayload:
            return "NotAnEncryptedPayload";
        case ErrorKind::EncryptionFailed:
            return "EncryptionFailed";
    }
    return "Unknown";
}

bool IsRetryable(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NetworkError:
        case ErrorKind::TransactionNotFound:
        case ErrorKind::TransactionNotFoundOnAnyNetwork:
        case ErrorKind::NoOutgoingTransactionsFound:
            return true;
        default:
            return false;
    }
}

std::string UserMessageFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DecryptionFailed:
            return "Wrong passphrase or key, or the data is corrupted";
        case ErrorKind::AddressMismatch:
            return "This key does not belong to the expected address";
        case ErrorKind::MissingApiKey:
            return "Explorer API key is not configured";
        case ErrorKind::UnsupportedChain:
            return "No network is configured for this chain";
        case ErrorKind::InvalidPublicKey:
            return "Invalid public key";
        case ErrorKind::InvalidPrivateKey:
            return "Invalid private key";
        case ErrorKind::NotAnEncryptedPayload:
            return "Not an encrypted message";
        case ErrorKind::MalformedHex:
            return "Calldata is not valid hex";
        case ErrorKind::EmptyInput:
            return "Input is empty";
        default:
            break;
    }
    if (IsRetryable(kind)) {
        return "Network or availability issue, try again in a moment";
    }
    return "Operation failed";
}

} // namespace Callout
