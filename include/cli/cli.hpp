#pragma once

#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>
#include "cli/app_config.hpp"
#include "client/base64_session.hpp"
#include "client/progressive_loader.hpp"
#include "client/virtualized_view.hpp"
#include "service/chunk_fetch_service.hpp"

namespace docpipe {
namespace cli {

// Store slots the shell works with
inline constexpr const char* INPUT_SLOT = "input";
inline constexpr const char* OUTPUT_SLOT = "output";

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(service::ChunkFetchService& service, const transform::TransformPipeline& pipeline,
        service::FetchClient& fetch_client, const AppConfig& config,
        std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();
    // Runs one command line; returns false once the shell should stop
    bool execute(const std::string& line);
    bool is_running() const { return running_; }


    // ---- GETTERS ----
    const std::string& active_tool() const { return active_tool_; }
    const std::string& viewed_slot() const { return viewed_slot_; }
    const client::ProgressiveLoader& loader() const { return loader_; }

private:
    // ---- PARAMETERS ----
    bool running_;
    AppConfig config_;
    std::istream& in_;
    std::ostream& out_;
    // System components
    service::ChunkFetchService& service_;
    const transform::TransformPipeline& pipeline_;
    client::ProgressiveLoader loader_;
    client::VirtualizedView view_;
    client::Base64Session base64_;
    std::string active_tool_;

    // What the viewer shows: either a whole small entry or the loader's mirror
    std::string viewed_slot_;
    bool direct_;
    std::string direct_text_;
    std::string mirror_;
    std::uint64_t mirror_session_;

    // Loader progress, signalled from fetch handlers
    std::mutex progress_mutex_;
    std::condition_variable progress_cv_;
    client::ProgressiveLoader::Subscription subscription_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& argument);
    void handle_load_command(const std::string& filename);
    void handle_paste_command();
    void handle_tool_command(const std::string& name);
    void handle_tools_command();
    void handle_format_command();
    void handle_view_command(const std::string& slot);
    void handle_show_command();
    void handle_scroll_command(long lines);
    void handle_info_command();
    void handle_copy_command();
    void handle_save_command(const std::string& filename);
    void handle_base64_command(const std::string& argument);
    void handle_clear_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);


    // ---- VIEWER ----
    void replace_input(const store::EntryInfo& info);
    void select_slot(const std::string& slot);
    void drop_view();
    // Reports scroll metrics to the loader and waits for what it requested
    void report_scroll();
    void wait_for_loader();
    void sync_view();
};

} // namespace cli
} // namespace docpipe
