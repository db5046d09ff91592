//! # CLI Driver
//!
//! ```text
//! modload_main()
//!   ├─ --help, -h      → print_usage()
//!   ├─ --version, -V   → print_version()
//!   ├─ <module>...     → open each, print id / path / directory
//!   └─ --call=<symbol> → open one module, invoke a void() export
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                         |
//! |------|---------------------------------|
//! | 0    | Success                         |
//! | 1    | Load, lookup or call failure    |
//! | 2    | Usage error                     |

#include "modload/cli/driver.hpp"

#include "modload/common.hpp"
#include "modload/loader/config.hpp"
#include "modload/loader/registry.hpp"
#include "modload/log/log.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace modload::cli {

namespace {

/// The only signature `--call` can invoke.
constexpr std::string_view VOID_CALL_TYPE = "fn()";

void print_usage() {
    std::cout << "Usage: modload [options] <module>...\n"
              << "       modload [options] --call=<symbol> <module>\n"
              << "\n"
              << "Opens each module and prints its identifier, path and exports.\n"
              << "\n"
              << "Options:\n"
              << "  --call=<symbol>       Invoke an fn() export of the module\n"
              << "  --search-path=<dirs>  Directories searched for bare module names\n"
              << "  --cache-dir=<dir>     Where compressed modules are decompressed\n"
              << "  --bind-now            Resolve all symbols at load time\n"
              << "  --global              Make module symbols globally visible\n"
              << "  --log-level=<level>   trace, debug, info, warn, error, fatal, off\n"
              << "  --log-filter=<spec>   Per-module levels, e.g. loader=trace,*=warn\n"
              << "  --log-file=<path>     Also write log records to a file\n"
              << "  --log-format=<fmt>    text or json\n"
              << "  -v, -vv, -vvv         Info, debug, trace logging\n"
              << "  -q, --quiet           Errors only\n"
              << "  -h, --help            Show this message\n"
              << "  -V, --version         Show the version\n";
}

void print_version() {
    std::cout << "modload " << VERSION << "\n";
}

void print_module(const loader::Module& module) {
    std::cout << module.id() << "  " << module.path().string() << "\n";
    for (const auto& [name, symbol] : module.symbols()) {
        std::cout << "  " << std::left << std::setw(9) << loader::symbol_kind_name(symbol.kind())
                  << std::setw(24) << name;
        if (!symbol.type_descriptor().empty()) {
            std::cout << symbol.type_descriptor();
        }
        std::cout << "\n";
    }
}

int report(const loader::LoadError& error) {
    std::cerr << "error: " << error.message() << "\n";
    return 1;
}

} // namespace

int run(int argc, char* argv[]) {
    std::vector<std::string> modules;
    std::string call_symbol;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        if (arg == "--version" || arg == "-V") {
            print_version();
            return 0;
        }
        if (arg.starts_with("--call=")) {
            call_symbol = std::string(arg.substr(7));
            continue;
        }
        if (log::is_log_option(arg) || loader::is_loader_option(arg)) {
            continue;
        }
        if (arg.starts_with("-")) {
            std::cerr << "error: unknown option '" << arg << "'\n";
            return 2;
        }
        modules.emplace_back(arg);
    }

    if (modules.empty()) {
        print_usage();
        return 2;
    }
    if (!call_symbol.empty() && modules.size() != 1) {
        std::cerr << "error: --call takes exactly one module\n";
        return 2;
    }

    log::Logger::init(log::parse_log_options(argc, argv));

    auto config = loader::LoaderConfig::from_environment();
    loader::apply_loader_options(config, argc, argv);
    loader::ModuleRegistry registry(std::move(config));

    int status = 0;
    for (const auto& reference : modules) {
        auto opened = registry.open(reference);
        if (is_err(opened)) {
            status = report(unwrap_err(opened));
            continue;
        }
        const auto& module = unwrap(opened);

        if (call_symbol.empty()) {
            print_module(*module);
            continue;
        }

        auto found = module->lookup(call_symbol);
        if (is_err(found)) {
            return report(unwrap_err(found));
        }
        const auto& symbol = unwrap(found);
        if (!symbol.is_callable()) {
            std::cerr << "error: " << call_symbol << " is not callable\n";
            return 1;
        }
        if (symbol.type_descriptor() != VOID_CALL_TYPE) {
            std::cerr << "error: " << call_symbol << " has type '" << symbol.type_descriptor()
                      << "', --call needs " << VOID_CALL_TYPE << "\n";
            return 1;
        }
        auto* fn = symbol.as_function<void()>();
        MODLOAD_LOG_INFO("cli", "calling " << module->id() << "." << call_symbol);
        fn();
    }

    log::Logger::instance().flush();
    return status;
}

} // namespace modload::cli

int modload_main(int argc, char* argv[]) {
    return modload::cli::run(argc, argv);
}
