//! # Path Resolver Implementation

#include "modload/loader/path_resolver.hpp"

#include "modload/log/log.hpp"

namespace modload::loader {

static constexpr std::string_view COMPRESSED_SUFFIX = ".zst";

/// Lower rank = more specific. NotFound is the least informative outcome.
static int specificity(ResolutionCode code) {
    switch (code) {
    case ResolutionCode::AccessDenied:
        return 0;
    case ResolutionCode::NotADirectory:
        return 1;
    case ResolutionCode::OtherIo:
        return 2;
    case ResolutionCode::NotFound:
        return 3;
    }
    return 3;
}

PathResolver::PathResolver(const LoaderConfig& config)
    : search_paths_(config.search_paths), suffix_(config.library_suffix) {}

auto PathResolver::candidates(std::string_view reference) const -> std::vector<fs::path> {
    fs::path ref{std::string(reference)};

    std::vector<fs::path> bases{ref};
    if (!ref.is_absolute() && !ref.has_parent_path()) {
        for (const auto& dir : search_paths_) {
            bases.push_back(dir / ref);
        }
    }

    std::vector<fs::path> out;
    out.reserve(bases.size() * 3);
    for (const auto& base : bases) {
        std::string name = base.string();
        out.push_back(base);
        if (!has_library_suffix(name, suffix_)) {
            out.emplace_back(name + suffix_);
            out.emplace_back(name + suffix_ + std::string(COMPRESSED_SUFFIX));
        } else {
            out.emplace_back(name + std::string(COMPRESSED_SUFFIX));
        }
    }
    return out;
}

auto PathResolver::resolve(std::string_view reference) const -> Result<ResolvedPath, LoadError> {
    if (reference.empty()) {
        return LoadError::resolution_failed(
            reference, std::make_error_code(std::errc::no_such_file_or_directory));
    }

    std::error_code best_error = std::make_error_code(std::errc::no_such_file_or_directory);

    for (const auto& candidate : candidates(reference)) {
        std::error_code ec;
        auto canonical = fs::canonical(candidate, ec);
        if (!ec) {
            if (fs::is_directory(canonical, ec)) {
                continue;
            }
            ResolvedPath resolved;
            resolved.compressed = canonical.string().ends_with(COMPRESSED_SUFFIX);
            resolved.canonical = std::move(canonical);
            MODLOAD_LOG_DEBUG("loader", "resolved \"" << reference << "\" -> "
                                                      << resolved.canonical.string());
            return resolved;
        }
        if (specificity(classify_resolution(ec)) < specificity(classify_resolution(best_error))) {
            best_error = ec;
        }
    }

    MODLOAD_LOG_DEBUG("loader", "cannot resolve \"" << reference << "\": " << best_error.message());
    return LoadError::resolution_failed(reference, best_error);
}

auto PathResolver::module_name(std::string_view reference) const -> std::string {
    std::string name = fs::path{std::string(reference)}.filename().string();
    if (name.ends_with(COMPRESSED_SUFFIX)) {
        name.resize(name.size() - COMPRESSED_SUFFIX.size());
    }
    if (!suffix_.empty() && name.size() > suffix_.size() && has_library_suffix(name, suffix_)) {
        name.resize(name.size() - suffix_.size());
    }
    return name;
}

} // namespace modload::loader
