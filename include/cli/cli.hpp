#pragma once

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "config/config.hpp"
#include "transfer/progress_channel.hpp"
#include "transfer/transfer_task.hpp"

namespace distore {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(config::Config& config, const std::string& version, std::ostream& out = std::cout);


    // ---- STARTUP ----
    // Runs a single command given as words, returns the process exit code
    int execute(const std::vector<std::string>& words);
    // Interactive shell reading one command per line
    void run(std::istream& in = std::cin);


    // ---- LOCATIONS ----
    // $XDG_CACHE_HOME/distore, else $HOME/.cache/distore, else the temp directory
    static std::filesystem::path cache_directory();

private:
    // Container and record store a command operates on
    struct Target {
        std::string container;
        std::filesystem::path store_path;
    };

    // ---- PARAMETERS ----
    bool running_;
    config::Config& config_;
    std::string version_;
    std::ostream& out_;
    // Phase whose progress bar is currently drawn, owned by the foreground
    std::optional<transfer::Phase> active_phase_;


    // ---- COMMAND PROCESSING ----
    int process_command(const std::string& command, const std::vector<std::string>& args);
    int handle_config_command(const std::vector<std::string>& args);
    int handle_disassemble_command(const std::vector<std::string>& args);
    int handle_assemble_command(const std::vector<std::string>& args);
    int handle_upload_command(const std::vector<std::string>& args);
    int handle_download_command(const std::vector<std::string>& args);
    int handle_list_command(const std::vector<std::string>& args);
    int handle_delete_command(const std::vector<std::string>& args);
    void handle_help_command();
    int log_and_display_error(const std::string& message, const std::string& error);


    // ---- TRANSFER SUPPORT ----
    // Flag value if given, else the value configured for the working directory
    Target resolve_target(const std::optional<std::string>& container,
                          const std::optional<std::string>& store_path) const;
    // Runs operation on a background task and renders its events until it ends
    int run_transfer(transfer::TransferTask::Operation operation);
    void render_progress(const transfer::TransferProgress& progress);
    void finish_progress_line();
};

// Formats a byte count with binary units, e.g. "9.54 MiB"
std::string human_bytes(std::uint64_t bytes);

} // namespace cli
} // namespace distore
