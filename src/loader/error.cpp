//! # Loader Error Formatting

#include "modload/loader/error.hpp"

namespace modload::loader {

auto error_kind_name(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::Resolution:
        return "ResolutionError";
    case ErrorKind::Load:
        return "LoadError";
    case ErrorKind::SymbolNotFound:
        return "SymbolNotFound";
    case ErrorKind::PreviousFailure:
        return "PreviousFailure";
    case ErrorKind::RecursiveLoad:
        return "RecursiveLoad";
    }
    return "UnknownError";
}

auto resolution_code_name(ResolutionCode code) -> const char* {
    switch (code) {
    case ResolutionCode::NotFound:
        return "not found";
    case ResolutionCode::NotADirectory:
        return "not a directory";
    case ResolutionCode::AccessDenied:
        return "access denied";
    case ResolutionCode::OtherIo:
        return "i/o error";
    }
    return "i/o error";
}

auto classify_resolution(const std::error_code& ec) -> ResolutionCode {
    auto cond = ec.default_error_condition();
    if (cond == std::errc::no_such_file_or_directory) {
        return ResolutionCode::NotFound;
    }
    if (cond == std::errc::not_a_directory) {
        return ResolutionCode::NotADirectory;
    }
    if (cond == std::errc::permission_denied || cond == std::errc::operation_not_permitted) {
        return ResolutionCode::AccessDenied;
    }
    return ResolutionCode::OtherIo;
}

/// Message text without the `open("...")` prefix.
static auto describe(const LoadError& err) -> std::string {
    switch (err.kind) {
    case ErrorKind::Resolution:
        return "cannot resolve module path: " +
               std::string(resolution_code_name(err.resolution)) +
               (err.detail.empty() ? "" : " (" + err.detail + ")");
    case ErrorKind::SymbolNotFound: {
        std::string text = "could not find symbol " + err.symbol;
        if (!err.detail.empty()) {
            text += ": " + err.detail;
        }
        return text;
    }
    case ErrorKind::RecursiveLoad:
        return "recursive load of " + err.module_path + " from its own initializer";
    case ErrorKind::Load:
    case ErrorKind::PreviousFailure:
        return err.detail;
    }
    return err.detail;
}

auto LoadError::message() const -> std::string {
    if (kind == ErrorKind::SymbolNotFound && reference.empty()) {
        return "symbol " + symbol + " not found in module " + module_path;
    }

    std::string text;
    if (!reference.empty()) {
        text = "open(\"" + reference + "\"): ";
    }
    text += describe(*this);
    if (kind == ErrorKind::PreviousFailure) {
        text += " (previous failure)";
    }
    return text;
}

auto LoadError::resolution_failed(std::string_view reference, const std::error_code& ec)
    -> LoadError {
    LoadError err;
    err.kind = ErrorKind::Resolution;
    err.reference = std::string(reference);
    err.resolution = classify_resolution(ec);
    err.detail = ec.message();
    err.platform_code = ec.value();
    return err;
}

auto LoadError::load_failed(std::string detail, int platform_code) -> LoadError {
    LoadError err;
    err.kind = ErrorKind::Load;
    err.detail = std::move(detail);
    err.platform_code = platform_code;
    return err;
}

auto LoadError::symbol_missing(std::string symbol, std::string detail) -> LoadError {
    LoadError err;
    err.kind = ErrorKind::SymbolNotFound;
    err.symbol = std::move(symbol);
    err.detail = std::move(detail);
    return err;
}

auto LoadError::not_in_directory(std::string_view symbol, std::string_view module_path)
    -> LoadError {
    LoadError err;
    err.kind = ErrorKind::SymbolNotFound;
    err.symbol = std::string(symbol);
    err.module_path = std::string(module_path);
    return err;
}

auto LoadError::recursive(std::string_view reference, std::string_view module_path) -> LoadError {
    LoadError err;
    err.kind = ErrorKind::RecursiveLoad;
    err.reference = std::string(reference);
    err.module_path = std::string(module_path);
    return err;
}

auto LoadError::as_previous_failure(std::string_view later_reference) const -> LoadError {
    LoadError err = *this;
    err.kind = ErrorKind::PreviousFailure;
    err.cause = kind == ErrorKind::PreviousFailure ? cause : kind;
    err.reference = std::string(later_reference);
    err.detail = describe(*this);
    return err;
}

} // namespace modload::loader
