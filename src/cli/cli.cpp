#include "cli/cli.hpp"
#include "transform/builtin_transforms.hpp"
#include <chrono>
#include <cmath>
#include <fstream>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace docpipe {
namespace cli {

namespace {

constexpr auto LOADER_WAIT = std::chrono::seconds(5);

std::string trim(const std::string& text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(service::ChunkFetchService& service, const transform::TransformPipeline& pipeline,
         service::FetchClient& fetch_client, const AppConfig& config,
         std::istream& in, std::ostream& out)
  : running_(false)
  , config_(config)
  , in_(in)
  , out_(out)
  , service_(service)
  , pipeline_(pipeline)
  , loader_(fetch_client, client::LoaderOptions{config.load_more_threshold})
  , view_(client::ViewportConfig{config.line_height, config.viewport_height, config.buffer_lines})
  , base64_(pipeline)
  , active_tool_(transform::JSON_TRANSFORM)
  , direct_(false)
  , mirror_session_(0) {
  subscription_ = loader_.subscribe([this](const client::LoaderSnapshot&) {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    progress_cv_.notify_all();
  });
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "docpipe> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    execute(line);
    if (running_) {
      out_ << "docpipe> " << std::flush;
    }
  }

  running_ = false;
  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  const std::string trimmed = trim(line);
  if (trimmed.empty()) {
    return running_;
  }
  if (trimmed == "quit" || trimmed == "exit") {
    running_ = false;
    return false;
  }

  std::istringstream iss(trimmed);
  std::string command;
  iss >> command;
  std::string argument;
  std::getline(iss, argument);

  process_command(command, trim(argument));
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& argument) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with argument: " << argument;

  try {
    if (command == "load" && !argument.empty()) {
      handle_load_command(argument);
    }
    else if (command == "paste" && argument.empty()) {
      handle_paste_command();
    }
    else if (command == "tool" && !argument.empty()) {
      handle_tool_command(argument);
    }
    else if (command == "tools" && argument.empty()) {
      handle_tools_command();
    }
    else if (command == "format" && argument.empty()) {
      handle_format_command();
    }
    else if (command == "view" && (argument == INPUT_SLOT || argument == OUTPUT_SLOT)) {
      handle_view_command(argument);
    }
    else if (command == "show" && argument.empty()) {
      handle_show_command();
    }
    else if (command == "down" || command == "up") {
      const auto page = static_cast<long>(std::ceil(config_.viewport_height / config_.line_height));
      const long lines = argument.empty() ? page : std::stol(argument);
      handle_scroll_command(command == "down" ? lines : -lines);
    }
    else if (command == "top" && argument.empty()) {
      view_.scroll_to_top();
      handle_show_command();
    }
    else if (command == "end" && argument.empty()) {
      view_.scroll_to_end();
      handle_show_command();
    }
    else if (command == "info" && argument.empty()) {
      handle_info_command();
    }
    else if (command == "copy" && argument.empty()) {
      handle_copy_command();
    }
    else if (command == "save" && !argument.empty()) {
      handle_save_command(argument);
    }
    else if (command == "b64" && !argument.empty()) {
      handle_base64_command(argument);
    }
    else if (command == "clear" && argument.empty()) {
      handle_clear_command();
    }
    else if (command == "help" && argument.empty()) {
      handle_help_command();
    }
    else {
      out_ << "Unknown command or invalid arguments. Type 'help' for a list of commands." << std::endl;
    }
  } catch (const transform::TransformError& e) {
    BOOST_LOG_TRIVIAL(error) << "CLI: " << command << " failed: " << e.what();
    out_ << e.what() << std::endl;
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "CLI: " << command << " failed: " << e.what();
    out_ << "Operation failed" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error running " + command, e.what());
  }
}

void CLI::handle_load_command(const std::string& filename) {
  std::ifstream file(filename, std::ios::binary);
  if (!file) {
    out_ << "Error opening file: " << filename << std::endl;
    return;
  }
  replace_input(service_.put_stream(store::ContentKind::RAW, file, config_.chunk_size, std::string(INPUT_SLOT)));
}

void CLI::handle_paste_command() {
  out_ << "Enter content, finish with a line containing a single '.'" << std::endl;

  std::string text;
  std::string line;
  bool first = true;
  while (std::getline(in_, line) && line != ".") {
    if (!first) {
      text += '\n';
    }
    text += line;
    first = false;
  }
  replace_input(service_.put_content(store::ContentKind::RAW, text, config_.chunk_size, std::string(INPUT_SLOT)));
}

void CLI::handle_tool_command(const std::string& name) {
  if (!pipeline_.catalog().contains(name)) {
    out_ << "Unknown tool: " << name << ". Type 'tools' for the list." << std::endl;
    return;
  }
  active_tool_ = name;
  BOOST_LOG_TRIVIAL(info) << "CLI: Active tool is now " << name;
  out_ << "Active tool: " << name << std::endl;
}

void CLI::handle_tools_command() {
  out_ << "Available tools:" << std::endl;
  for (const auto& name : pipeline_.catalog().names()) {
    out_ << (name == active_tool_ ? "* " : "  ") << name << std::endl;
  }
}

void CLI::handle_format_command() {
  const store::EntryInfo info = service_.format_content(INPUT_SLOT, active_tool_, config_.derived_chunk_size,
                                                        std::string(OUTPUT_SLOT));
  out_ << "Formatted input with " << active_tool_ << " into output (" << info.length << " characters, "
       << info.chunk_count << " chunks)" << std::endl;

  if (viewed_slot_ == OUTPUT_SLOT) {
    select_slot(OUTPUT_SLOT);
  }
}

void CLI::handle_view_command(const std::string& slot) {
  select_slot(slot);
  handle_show_command();
}

void CLI::handle_show_command() {
  if (viewed_slot_.empty()) {
    out_ << "Nothing to show. Use 'view input' or 'view output'." << std::endl;
    return;
  }

  report_scroll();
  view_.render(out_);

  const client::RenderWindow win = view_.window();
  out_ << "-- " << viewed_slot_ << ": lines " << (win.end_line == 0 ? 0 : win.start_line + 1) << "-"
       << win.end_line << " of " << view_.line_count();
  if (!direct_) {
    const client::LoaderSnapshot snap = loader_.snapshot();
    out_ << ", " << snap.retrieved_count << "/" << snap.chunk_count << " chunks loaded";
    if (snap.state == client::LoaderState::State::FAILED) {
      out_ << ", loading failed (" << snap.error << ")";
    }
  }
  out_ << std::endl;
}

void CLI::handle_scroll_command(long lines) {
  view_.scroll_lines(lines);
  handle_show_command();
}

void CLI::handle_info_command() {
  for (const char* slot : {INPUT_SLOT, OUTPUT_SLOT}) {
    try {
      const store::EntryInfo info = service_.get_info(slot);
      out_ << slot << ": " << info.kind << ", " << info.length << " characters (" << info.byte_length
           << " bytes), " << info.chunk_count << " chunks of " << info.chunk_size;
      if (!info.transform.empty()) {
        out_ << ", " << info.transform << " of " << info.source_id;
      }
      out_ << ", sha256 " << info.digest << std::endl;
    } catch (const store::NotFoundError&) {
      out_ << slot << ": empty" << std::endl;
    }
  }

  out_ << "tool: " << active_tool_ << std::endl;
  if (viewed_slot_.empty()) {
    out_ << "viewing: nothing" << std::endl;
  } else if (direct_) {
    out_ << "viewing: " << viewed_slot_ << " (loaded whole)" << std::endl;
  } else {
    const client::LoaderSnapshot snap = loader_.snapshot();
    out_ << "viewing: " << viewed_slot_ << " (" << snap.state << ", " << snap.retrieved_count << "/"
         << snap.chunk_count << " chunks, " << static_cast<int>(loader_.progress() * 100.0) << "%)" << std::endl;
  }
}

void CLI::handle_copy_command() {
  if (viewed_slot_.empty()) {
    out_ << "Nothing to copy. Use 'view input' or 'view output'." << std::endl;
    return;
  }
  out_ << service_.fetch_all(viewed_slot_, config_.fetch_all_limit).content << std::endl;
}

void CLI::handle_save_command(const std::string& filename) {
  if (viewed_slot_.empty()) {
    out_ << "Nothing to save. Use 'view input' or 'view output'." << std::endl;
    return;
  }

  std::ofstream file(filename, std::ios::binary | std::ios::trunc);
  if (!file) {
    out_ << "Error opening file: " << filename << std::endl;
    return;
  }

  const store::EntryInfo info = service_.get_info(viewed_slot_);
  for (std::size_t index = 0; index < info.chunk_count; ++index) {
    const service::ChunkResponse response = service_.fetch_chunk(viewed_slot_, index);
    file.write(response.content.data(), static_cast<std::streamsize>(response.content.size()));
  }
  if (!file) {
    log_and_display_error("Error writing file", filename);
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: Saved " << viewed_slot_ << " to " << filename;
  out_ << "Saved " << info.length << " characters to " << filename << std::endl;
}

void CLI::handle_base64_command(const std::string& argument) {
  std::istringstream iss(argument);
  std::string side;
  iss >> side;
  std::string text;
  std::getline(iss, text);
  text = trim(text);

  if (side == "plain") {
    base64_.set_plain(text);
  } else if (side == "encoded") {
    base64_.set_encoded(text);
  } else {
    out_ << "Usage: b64 plain <text> | b64 encoded <text>" << std::endl;
    return;
  }

  const client::Base64View view = base64_.view();
  out_ << "plain:   " << view.plain << std::endl;
  out_ << "encoded: " << view.encoded << std::endl;
  if (!view.error.empty()) {
    out_ << "error:   " << view.error << std::endl;
  }
}

void CLI::handle_clear_command() {
  drop_view();
  service_.clear(INPUT_SLOT);
  service_.clear(OUTPUT_SLOT);
  base64_.clear();
  out_ << "Cleared input and output" << std::endl;
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  load <file>            Load <file> as input" << std::endl;
  out_ << "  paste                  Type input, end with a line containing '.'" << std::endl;
  out_ << "  tools                  List the available tools" << std::endl;
  out_ << "  tool <name>            Select the tool used by format" << std::endl;
  out_ << "  format                 Run the active tool over input into output" << std::endl;
  out_ << "  view input|output      Show an entry in the viewer" << std::endl;
  out_ << "  show                   Render the visible lines" << std::endl;
  out_ << "  down [n] / up [n]      Scroll by n lines (default one page)" << std::endl;
  out_ << "  top / end              Jump to the start or the loaded end" << std::endl;
  out_ << "  info                   Entry details and loading progress" << std::endl;
  out_ << "  copy                   Print the whole viewed entry" << std::endl;
  out_ << "  save <file>            Write the whole viewed entry to <file>" << std::endl;
  out_ << "  b64 plain <text>       Encode <text> to base64" << std::endl;
  out_ << "  b64 encoded <text>     Decode base64 <text>" << std::endl;
  out_ << "  clear                  Remove input and output" << std::endl;
  out_ << "  help                   Display this help message" << std::endl;
  out_ << "  quit                   Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}


//==============================================
// VIEWER
//==============================================

void CLI::replace_input(const store::EntryInfo& info) {
  // New input invalidates whatever was formatted from the old one
  if (viewed_slot_ == OUTPUT_SLOT) {
    drop_view();
  }
  service_.clear(OUTPUT_SLOT);

  out_ << "Loaded " << info.length << " characters into input (" << info.chunk_count << " chunks)" << std::endl;

  if (viewed_slot_ == INPUT_SLOT) {
    select_slot(INPUT_SLOT);
  }
}

void CLI::select_slot(const std::string& slot) {
  const store::EntryInfo info = service_.get_info(slot);
  viewed_slot_ = slot;

  if (info.length <= config_.direct_load_threshold) {
    loader_.reset();
    direct_ = true;
    direct_text_ = service_.fetch_all(slot, config_.fetch_all_limit).content;
    view_.set_source(&direct_text_);
  } else {
    direct_ = false;
    direct_text_.clear();
    loader_.select(info);
    wait_for_loader();
    sync_view();
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: Viewing " << slot << (direct_ ? " whole" : " progressively");
}

void CLI::drop_view() {
  loader_.reset();
  direct_ = false;
  direct_text_.clear();
  viewed_slot_.clear();
  view_.clear_source();
  sync_view();
}

void CLI::report_scroll() {
  if (direct_ || viewed_slot_.empty()) {
    return;
  }

  sync_view();
  for (;;) {
    const client::ScrollMetrics metrics = view_.scroll_metrics();
    if (!loader_.on_scroll(metrics.scroll_top, metrics.client_height, metrics.scroll_height)) {
      break;
    }
    wait_for_loader();
    sync_view();
  }

  if (loader_.is_superseded()) {
    BOOST_LOG_TRIVIAL(info) << "CLI: " << viewed_slot_ << " was replaced while loading, reselecting";
    select_slot(viewed_slot_);
  }
}

void CLI::wait_for_loader() {
  std::unique_lock<std::mutex> lock(progress_mutex_);
  if (!progress_cv_.wait_for(lock, LOADER_WAIT, [this]() { return !loader_.is_loading(); })) {
    BOOST_LOG_TRIVIAL(warning) << "CLI: Still waiting for a chunk of " << loader_.active_id();
  }
}

void CLI::sync_view() {
  const std::uint64_t previous_session = mirror_session_;
  if (!loader_.sync_mirror(mirror_session_, mirror_)) {
    return;
  }
  if (!direct_ && !viewed_slot_.empty() && previous_session != mirror_session_) {
    view_.set_source(&mirror_);
  }
}

} // namespace cli
} // namespace docpipe
