//! # modload Entry Point
//!
//! Delegates to the CLI driver (`cli/driver.hpp`).
//!
//! ```bash
//! modload ./math.so                 # list the exports of a module
//! modload --search-path=lib math    # resolve a bare name
//! modload --call=Run plugin.so.zst  # invoke a void() export
//! ```

#include "modload/cli/driver.hpp"

int main(int argc, char* argv[]) {
    return modload_main(argc, argv);
}
