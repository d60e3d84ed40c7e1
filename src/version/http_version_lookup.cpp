#include "version/http_version_lookup.hpp"

#include "core/json_dom.hpp"

#include <curl/curl.h>

#include <cstddef>
#include <memory>
#include <utility>

namespace relsync::version {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

constexpr long kMaxRedirects = 5L;

std::size_t AppendBody(char* data, std::size_t size, std::size_t count, void* user_data) {
  auto* body = static_cast<std::string*>(user_data);
  body->append(data, size * count);
  return size * count;
}

} // namespace

bool ParseVersionRecords(std::string_view body, std::vector<VersionRecord>& records,
                         std::string& error) {
  using core::json::Value;

  records.clear();
  Value root;
  if (!core::json::Parse(body, root, error)) {
    error = "invalid version list: " + error;
    return false;
  }

  const Value* list = &root;
  if (root.type == Value::Type::kObject) {
    list = core::json::FindMember(root, "versions");
    if (list == nullptr) {
      error = "version list object has no 'versions' member";
      return false;
    }
  }
  if (list->type != Value::Type::kArray) {
    error = "version list must be a JSON array";
    return false;
  }

  for (const auto& item : list->array_value) {
    const Value* version = core::json::FindMember(item, "version");
    if (version == nullptr || version->type != Value::Type::kString) {
      continue;
    }
    VersionRecord record;
    record.version = version->string_value;
    const Value* stable = core::json::FindMember(item, "stable");
    record.stable = stable != nullptr && stable->type == Value::Type::kBool && stable->bool_value;
    records.push_back(std::move(record));
  }
  return true;
}

HttpVersionLookup::HttpVersionLookup(std::string url, const std::chrono::milliseconds timeout)
    : url_(std::move(url)), timeout_(timeout) {}

bool HttpVersionLookup::FetchVersions(std::vector<VersionRecord>& records, std::string& error) {
  records.clear();
  if (url_.empty()) {
    error = "version lookup url is empty";
    return false;
  }

  CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    error = "curl_easy_init failed";
    return false;
  }

  std::string body;
  char error_buffer[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, kMaxRedirects);
  curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "relsync");
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &AppendBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

  const CURLcode code = curl_easy_perform(curl.get());
  if (code != CURLE_OK) {
    error = "GET " + url_ + " failed: " +
            (error_buffer[0] != '\0' ? std::string(error_buffer)
                                     : std::string(curl_easy_strerror(code)));
    return false;
  }

  return ParseVersionRecords(body, records, error);
}

} // namespace relsync::version
