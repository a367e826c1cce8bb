#pragma once
#include <stdexcept>
#include <string>

// Classified probe failure. Every provider reports through these kinds
enum class ProbeErrorKind {
    BinaryNotFound,
    ExecutionFailed,
    Timeout,
    AuthenticationRequired,
    SessionExpired,         // credential irrecoverably invalid
    SubscriptionRequired,   // usage data gated by plan type
    ParseFailed,
    NoData,
    UpdateRequired,         // CLI refuses to run until updated
    FolderTrustRequired     // CLI waits on a folder-trust prompt
};

class ProbeError : public std::runtime_error {
public:
    ProbeError(ProbeErrorKind kind, const std::string& detail = "")
        : std::runtime_error(describe(kind, detail)),
          kind_(kind), detail_(detail) {}

    static ProbeError binaryNotFound(const std::string& binary) {
        return {ProbeErrorKind::BinaryNotFound, binary};
    }
    static ProbeError executionFailed(const std::string& reason) {
        return {ProbeErrorKind::ExecutionFailed, reason};
    }
    static ProbeError timeout() { return {ProbeErrorKind::Timeout}; }
    static ProbeError authenticationRequired() {
        return {ProbeErrorKind::AuthenticationRequired};
    }
    // loginHint tells the user how to sign in again for this provider
    static ProbeError sessionExpired(const std::string& loginHint = "") {
        return {ProbeErrorKind::SessionExpired, loginHint};
    }
    static ProbeError subscriptionRequired() {
        return {ProbeErrorKind::SubscriptionRequired};
    }
    static ProbeError parseFailed(const std::string& reason) {
        return {ProbeErrorKind::ParseFailed, reason};
    }
    static ProbeError noData() { return {ProbeErrorKind::NoData}; }
    static ProbeError updateRequired(const std::string& detail = "") {
        return {ProbeErrorKind::UpdateRequired, detail};
    }
    static ProbeError folderTrustRequired(const std::string& detail = "") {
        return {ProbeErrorKind::FolderTrustRequired, detail};
    }

    ProbeErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

    static const char* kindName(ProbeErrorKind kind) {
        switch (kind) {
            case ProbeErrorKind::BinaryNotFound:         return "binary_not_found";
            case ProbeErrorKind::ExecutionFailed:        return "execution_failed";
            case ProbeErrorKind::Timeout:                return "timeout";
            case ProbeErrorKind::AuthenticationRequired: return "authentication_required";
            case ProbeErrorKind::SessionExpired:         return "session_expired";
            case ProbeErrorKind::SubscriptionRequired:   return "subscription_required";
            case ProbeErrorKind::ParseFailed:            return "parse_failed";
            case ProbeErrorKind::NoData:                 return "no_data";
            case ProbeErrorKind::UpdateRequired:         return "update_required";
            case ProbeErrorKind::FolderTrustRequired:    return "folder_trust_required";
        }
        return "unknown";
    }

private:
    static std::string describe(ProbeErrorKind kind, const std::string& detail) {
        switch (kind) {
            case ProbeErrorKind::BinaryNotFound:
                return "CLI not found: " + detail;
            case ProbeErrorKind::ExecutionFailed:
                return "Execution failed: " + detail;
            case ProbeErrorKind::Timeout:
                return "Request timed out";
            case ProbeErrorKind::AuthenticationRequired:
                return "Authentication required. Please log in.";
            case ProbeErrorKind::SessionExpired:
                return "Session expired. " + (detail.empty() ? "Please log in again." : detail);
            case ProbeErrorKind::SubscriptionRequired:
                return "Subscription required for usage data";
            case ProbeErrorKind::ParseFailed:
                return "Failed to parse output: " + detail;
            case ProbeErrorKind::NoData:
                return "No usage data available";
            case ProbeErrorKind::UpdateRequired:
                return "CLI update required: " + detail;
            case ProbeErrorKind::FolderTrustRequired:
                return "Folder trust required: " + detail;
        }
        return "Unknown probe error";
    }

    ProbeErrorKind kind_;
    std::string detail_;
};
