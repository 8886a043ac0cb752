#include "cgmlst_main.hpp"

#include <curl/curl.h>

#include <filesystem>
#include <iostream>

int
main(int argc, char* argv[]) {
  cgmlst_cli::command cmd;
  try {
    cmd = cgmlst_cli::parse_args(argc, argv);
  } catch (const cgmlst_cli::usage_error& e) {
    std::cerr << "cgmlst-scraper: " << e.what() << "\n";
    cgmlst_cli::print_usage(std::cout);
    return cgmlst_cli::exit_usage;
  }

  curl_global_init(CURL_GLOBAL_DEFAULT);
  int rc = cgmlst_cli::run(cmd, cgmlst::make_transport(), std::cout, std::cerr,
                           std::filesystem::current_path());
  curl_global_cleanup();
  return rc;
}
