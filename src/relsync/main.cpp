#include "relsync/cli/router.hpp"

#include <curl/curl.h>

int main(int argc, char** argv) {
  // libcurl must be initialized before any other thread exists.
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    return 1;
  }
  const int exit_code = relsync::cli::Dispatch(argc, argv);
  curl_global_cleanup();
  return exit_code;
}
