#include "utils.hpp"

#include <CLI/Validators.hpp>

namespace cidgen
{
    void add_log_opts(CLI::App& cli, std::string& file, std::string& level)
    {
        file = "stderr";
        level = "info";

        cli.add_option("-l,--log-file", file, "Log output filename, or one of stdout/-/stderr/syslog.")
                ->type_name("FILE")
                ->capture_default_str();

        cli.add_option("-L,--log-level", level, "Log verbosity level; one of trace, debug, info, warn, error, critical, off")
                ->type_name("LEVEL")
                ->capture_default_str()
                ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    }

    void setup_logging(std::string out, const std::string& level)
    {
        logger_config(std::move(out), level);
        log::info(test_cat, "Logging configured at level {}", level);
    }

}  // namespace cidgen
