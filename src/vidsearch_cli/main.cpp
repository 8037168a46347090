#include <curl/curl.h>

#include <iostream>

#include "vidsearch_cli/cli_handler.hpp"

int main(int argc, char *argv[])
{
  curl_global_init(CURL_GLOBAL_DEFAULT);
  int exit_code = 0;
  try
  {
    vidsearch_cli::CliHandler handler;

    // Parse command line arguments
    vidsearch_cli::CliOptions options = handler.parse_arguments(argc, argv);

    // Execute the command
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  }

  curl_global_cleanup();
  return exit_code;
}
