#pragma once

#include <expected>
#include <string>
#include <unordered_map>
#include <utility>

namespace ecolog {

/**
 * @brief Error codes reported across ecolog component boundaries
 */
enum class EcologErrorCode {
  Success = 0,

  // File system errors
  FileNotFound,
  FileAccessDenied,

  // Language and parsing errors
  UnsupportedLanguage,
  ParseFailed,
  QueryCompileFailed,

  // Collaborator and task errors
  Timeout,
  Cancelled,

  // Configuration errors
  InvalidConfig,

  // Internal errors
  Internal,
  UnknownError
};

/**
 * @brief Error value carried by std::expected results
 */
class EcologError {
 public:
  EcologError() : code_(EcologErrorCode::Success) {}

  explicit EcologError(EcologErrorCode code) : code_(code) {
    message_ = GetDefaultMessage(code);
  }

  EcologError(EcologErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  bool ok() const { return code_ == EcologErrorCode::Success; }

  EcologErrorCode code() const { return code_; }

  const std::string& message() const { return message_; }

  explicit operator bool() const { return !ok(); }

  static std::string GetDefaultMessage(EcologErrorCode code) {
    static const std::unordered_map<EcologErrorCode, std::string> messages = {
        {EcologErrorCode::Success, "Success"},
        {EcologErrorCode::FileNotFound, "File not found"},
        {EcologErrorCode::FileAccessDenied, "Access to file denied"},
        {EcologErrorCode::UnsupportedLanguage, "Unsupported language"},
        {EcologErrorCode::ParseFailed, "Failed to parse file"},
        {EcologErrorCode::QueryCompileFailed, "Failed to compile query"},
        {EcologErrorCode::Timeout, "Operation timed out"},
        {EcologErrorCode::Cancelled, "Operation cancelled"},
        {EcologErrorCode::InvalidConfig, "Invalid configuration"},
        {EcologErrorCode::Internal, "Internal error"},
        {EcologErrorCode::UnknownError, "Unknown error"}};

    auto it = messages.find(code);
    if (it != messages.end()) {
      return it->second;
    }
    return "Unknown error";
  }

  // Default message for the code, with ": details" appended when given
  static EcologError Make(
      EcologErrorCode code, const std::string& details = "") {
    if (details.empty()) {
      return EcologError(code);
    }
    return EcologError(code, GetDefaultMessage(code) + ": " + details);
  }

  static std::unexpected<EcologError> Unexpected(
      EcologErrorCode code, const std::string& details = "") {
    return std::unexpected<EcologError>(Make(code, details));
  }

 private:
  EcologErrorCode code_ = EcologErrorCode::Success;
  std::string message_;
};

}  // namespace ecolog
