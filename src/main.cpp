#include "cli/app_config.hpp"
#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "service/async_fetch_client.hpp"
#include "transform/builtin_transforms.hpp"
#include <iostream>
#include <string>
#include <boost/log/trivial.hpp>

bool run_shell(const docpipe::cli::ProgramOptions& options) {
  try {
    const docpipe::cli::AppConfig& config = options.config;
    docpipe::logging::init_logging(config.log_file, config.log_level, config.log_to_console);

    docpipe::store::ContentStore store;
    docpipe::transform::TransformCatalog catalog;
    docpipe::transform::register_builtin_transforms(catalog);
    docpipe::transform::TransformPipeline pipeline(store, catalog);
    docpipe::service::ChunkFetchService service(store, pipeline);
    docpipe::service::AsyncFetchClient client(service);

    {
      docpipe::cli::CLI cli(service, pipeline, client, config);
      if (!options.initial_file.empty()) {
        cli.execute("load " + options.initial_file);
      }
      cli.run();
      // Handlers must not outlive the shell
      client.shutdown();
    }
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Shell terminated: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = docpipe::cli::parse_command_line(argc, argv, std::cerr);
  if (!options.valid) {
    return 1;
  }
  if (options.show_help) {
    docpipe::cli::print_usage(std::cout, argv[0]);
    return 0;
  }
  return run_shell(options) ? 0 : 1;
}
